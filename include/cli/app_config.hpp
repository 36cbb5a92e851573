#ifndef DOCPIPE_CLI_APP_CONFIG_HPP
#define DOCPIPE_CLI_APP_CONFIG_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include "logger/logger.hpp"

namespace docpipe {
namespace cli {

struct AppConfig {
  // Chunking, in characters
  std::size_t chunk_size{50000};
  std::size_t derived_chunk_size{50000};
  // Entries at or below this length are shown whole instead of progressively
  std::size_t direct_load_threshold{50000};
  std::size_t fetch_all_limit{100 * 1024 * 1024};

  // Viewer
  double load_more_threshold{0.8};
  double line_height{20.0};
  double viewport_height{400.0};
  std::size_t buffer_lines{10};

  // Logging
  std::string log_file{"docpipe.log"};
  logging::severity_level log_level{boost::log::trivial::info};
  bool log_to_console{false};

  // Throws InvalidArgumentError on the first bad value
  void validate() const;
};

struct ProgramOptions {
  AppConfig config;
  std::string initial_file;
  bool show_help{false};
  bool valid{false};
};

void print_usage(std::ostream& out, const std::string& program_name);

// Unknown flags, missing values and unparsable numbers are reported to `err` and leave
// the result invalid
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

} // namespace cli
} // namespace docpipe

#endif // DOCPIPE_CLI_APP_CONFIG_HPP
