#ifndef BLOCKSTORE_LOGGER_HPP
#define BLOCKSTORE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace blockstore {
namespace logging {

// ---- INITIALIZATION ----
// Installs a file sink at logs/<log_name>.log and, if requested, a console sink.
// Replaces any sinks installed by an earlier call.
void init_logging(const std::string& log_name,
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info,
                  bool console = false);


// ---- RUNTIME CONTROL ----
void set_log_level(boost::log::trivial::severity_level level);
void enable_logging();
void disable_logging();

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
// Throws std::invalid_argument on anything else
boost::log::trivial::severity_level parse_log_level(const std::string& name);

} // namespace logging
} // namespace blockstore

#endif // BLOCKSTORE_LOGGER_HPP
