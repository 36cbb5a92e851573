#include "cli/app_config.hpp"
#include "store/store_error.hpp"
#include <functional>
#include <unordered_map>

namespace docpipe {
namespace cli {

void AppConfig::validate() const {
  if (chunk_size == 0) {
    throw store::InvalidArgumentError("chunk size must be positive");
  }
  if (derived_chunk_size == 0) {
    throw store::InvalidArgumentError("derived chunk size must be positive");
  }
  if (!(load_more_threshold > 0.0 && load_more_threshold <= 1.0)) {
    throw store::InvalidArgumentError("load-more threshold must be in (0, 1]");
  }
  if (!(line_height > 0.0)) {
    throw store::InvalidArgumentError("line height must be positive");
  }
  if (!(viewport_height > 0.0)) {
    throw store::InvalidArgumentError("viewport height must be positive");
  }
}

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -c, --chunk-size <n>          Characters per chunk of loaded content (default 50000)\n"
      << "  -d, --derived-chunk-size <n>  Characters per chunk of formatted content (default 50000)\n"
      << "  -t, --threshold <ratio>       Scroll fraction that triggers the next chunk (default 0.8)\n"
      << "  -H, --viewport-height <px>    Height of the viewer (default 400)\n"
      << "  -l, --log-file <path>         Log file (default docpipe.log)\n"
      << "  -v, --log-level <level>       trace, debug, info, warning, error or fatal (default info)\n"
      << "      --console-log             Also log to stderr\n"
      << "  -f, --file <path>             File to load on start\n"
      << "      --help                    Show this message\n"
      << "Example: " << program_name << " -c 10000 -f data.json\n";
}

namespace {

std::size_t parse_size(const std::string& value) {
  if (value.empty() || value[0] == '-') {
    throw store::InvalidArgumentError("expected a non-negative number, got '" + value + "'");
  }
  std::size_t consumed = 0;
  const unsigned long long parsed = std::stoull(value, &consumed);
  if (consumed != value.size()) {
    throw store::InvalidArgumentError("expected a number, got '" + value + "'");
  }
  return static_cast<std::size_t>(parsed);
}

double parse_double(const std::string& value) {
  std::size_t consumed = 0;
  const double parsed = std::stod(value, &consumed);
  if (consumed != value.size()) {
    throw store::InvalidArgumentError("expected a number, got '" + value + "'");
  }
  return parsed;
}

} // namespace

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "docpipe";

  using Setter = std::function<void(const std::string&)>;
  AppConfig& config = options.config;
  const std::unordered_map<std::string, Setter> value_flags = {
    {"-c", [&](const std::string& v) { config.chunk_size = parse_size(v); }},
    {"--chunk-size", [&](const std::string& v) { config.chunk_size = parse_size(v); }},
    {"-d", [&](const std::string& v) { config.derived_chunk_size = parse_size(v); }},
    {"--derived-chunk-size", [&](const std::string& v) { config.derived_chunk_size = parse_size(v); }},
    {"-t", [&](const std::string& v) { config.load_more_threshold = parse_double(v); }},
    {"--threshold", [&](const std::string& v) { config.load_more_threshold = parse_double(v); }},
    {"-H", [&](const std::string& v) { config.viewport_height = parse_double(v); }},
    {"--viewport-height", [&](const std::string& v) { config.viewport_height = parse_double(v); }},
    {"-l", [&](const std::string& v) { config.log_file = v; }},
    {"--log-file", [&](const std::string& v) { config.log_file = v; }},
    {"-v", [&](const std::string& v) { config.log_level = logging::parse_severity(v); }},
    {"--log-level", [&](const std::string& v) { config.log_level = logging::parse_severity(v); }},
    {"-f", [&](const std::string& v) { options.initial_file = v; }},
    {"--file", [&](const std::string& v) { options.initial_file = v; }}
  };

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--help") {
      options.show_help = true;
      options.valid = true;
      return options;
    }
    if (flag == "--console-log") {
      config.log_to_console = true;
      continue;
    }

    const auto it = value_flags.find(flag);
    if (it == value_flags.end()) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(err, program_name);
      return options;
    }
    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(err, program_name);
      return options;
    }

    const std::string value(argv[++i]);
    try {
      it->second(value);
    } catch (const std::exception& e) {
      err << "Error: Invalid value for " << flag << ": " << e.what() << '\n';
      print_usage(err, program_name);
      return options;
    }
  }

  try {
    config.validate();
  } catch (const store::StoreError& e) {
    err << "Error: " << e.what() << '\n';
    print_usage(err, program_name);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace cli
} // namespace docpipe
