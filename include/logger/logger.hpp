#ifndef DOCPIPE_LOGGER_HPP
#define DOCPIPE_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace docpipe {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces every sink with a rotating file sink (and a console sink if asked for)
// and filters out records below min_level
void init_logging(const std::string& log_file = "docpipe.log",
                  severity_level min_level = boost::log::trivial::info,
                  bool console = false);

void set_log_level(severity_level level);
void enable_logging();
void disable_logging();

// "trace", "debug", "info", "warning", "error" or "fatal". Throws InvalidArgumentError.
severity_level parse_severity(const std::string& name);

} // namespace logging
} // namespace docpipe

#endif // DOCPIPE_LOGGER_HPP
