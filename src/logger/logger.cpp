#include "logger/logger.hpp"
#include "store/store_error.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <filesystem>
#include <iostream>

namespace docpipe {
namespace logging {

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
  namespace expr = boost::log::expressions;
  namespace keywords = boost::log::keywords;

  try {
    boost::log::core::get()->remove_all_sinks();
    boost::log::add_common_attributes();

    const auto format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "]"
        << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage
    );

    const std::filesystem::path log_path = std::filesystem::absolute(log_file);
    boost::log::add_file_log(
      keywords::file_name = log_path.string(),
      keywords::format = format,
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::open_mode = std::ios::out | std::ios::app,
      keywords::auto_flush = true
    );

    if (console) {
      boost::log::add_console_log(std::clog, keywords::format = format, keywords::auto_flush = true);
    }

    set_log_level(min_level);
    enable_logging();
  } catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Logging: Writing to " << log_file << " at level " << min_level;
}

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

severity_level parse_severity(const std::string& name) {
  severity_level level;
  if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    throw store::InvalidArgumentError("unknown log level '" + name + "'");
  }
  return level;
}

} // namespace logging
} // namespace docpipe
