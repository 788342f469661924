#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace blockstore {
namespace logging {

namespace {

const char* LOG_DIRECTORY = "logs";

template <typename Sink>
void apply_format(Sink& sink) {
  namespace expr = boost::log::expressions;
  sink->set_formatter(
    expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "]"
      << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "] "
      << expr::smessage);
}

} // namespace

//==============================================
// INITIALIZATION
//==============================================

void init_logging(const std::string& log_name,
                  boost::log::trivial::severity_level min_level,
                  bool console) {
  try {
    auto core = boost::log::core::get();
    core->remove_all_sinks();

    // Create the log directory next to the working directory
    std::filesystem::create_directories(LOG_DIRECTORY);
    std::filesystem::path log_path =
      std::filesystem::absolute(std::filesystem::path(LOG_DIRECTORY) / (log_name + ".log"));

    auto file_backend = boost::make_shared<boost::log::sinks::text_file_backend>();
    file_backend->set_file_name_pattern(log_path.string());
    file_backend->set_open_mode(std::ios::out | std::ios::trunc);
    file_backend->auto_flush(true);

    using file_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    auto sink = boost::make_shared<file_sink>(file_backend);
    apply_format(sink);
    core->add_sink(sink);

    if (console) {
      auto console_backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
      console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      console_backend->auto_flush(true);

      using console_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
      auto csink = boost::make_shared<console_sink>(console_backend);
      apply_format(csink);
      core->add_sink(csink);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    core->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}


//==============================================
// RUNTIME CONTROL
//==============================================

void set_log_level(boost::log::trivial::severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

boost::log::trivial::severity_level parse_log_level(const std::string& name) {
  boost::log::trivial::severity_level level;
  if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    throw std::invalid_argument("Unknown log level: " + name);
  }
  return level;
}

} // namespace logging
} // namespace blockstore
