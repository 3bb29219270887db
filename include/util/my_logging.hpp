#pragma once

#include "simple_data.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <format>
#include <string>

namespace logging = boost::log;
namespace src = boost::log::sources;
namespace sinks = boost::log::sinks;
namespace trivial = logging::trivial;

namespace kubeplane {

inline trivial::severity_level parse_severity(const std::string &level) {
  if (level == "trace") {
    return trivial::trace;
  } else if (level == "debug") {
    return trivial::debug;
  } else if (level == "warning") {
    return trivial::warning;
  } else if (level == "error") {
    return trivial::error;
  } else if (level == "fatal") {
    return trivial::fatal;
  }
  return trivial::info;
}

inline void init_my_log(const cjj365::LoggingConfig &loggingConfig) {
  std::string logfile = std::format("{}/{}_%N.log", loggingConfig.log_dir,
                                    loggingConfig.log_file);

  auto sink = logging::add_file_log(
      logging::keywords::file_name = logfile,
      logging::keywords::rotation_size = loggingConfig.rotation_size,
      logging::keywords::format =
          "[%TimeStamp%] [%Severity%] [%ThreadID%]: %Message%",
      logging::keywords::auto_flush = true,
      logging::keywords::open_mode = std::ios_base::app);
  sink->locked_backend()->set_file_collector(
      logging::sinks::file::make_collector(
          logging::keywords::target = loggingConfig.log_dir,
          logging::keywords::max_size = loggingConfig.rotation_size * 10,
          logging::keywords::max_files = 10));
  sink->locked_backend()->scan_for_files();

  logging::add_common_attributes();
  logging::core::get()->set_filter(logging::trivial::severity >=
                                   parse_severity(loggingConfig.level));
}

} // namespace kubeplane
