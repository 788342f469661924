#ifndef BLOCKSTORE_CLIENT_OPTIONS_HPP
#define BLOCKSTORE_CLIENT_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <string>

namespace blockstore {
namespace client {

// Client-wide defaults and transport limits, fixed at construction.
//
// Per-call values override the defaults: an empty stamp or redundancy level
// means "use the default". Pin is sticky true: a default of true pins every
// upload, while a default of false never suppresses a caller's explicit true.
struct ClientOptions {
  std::string stamp;
  std::string redundancy;
  bool pin{false};

  std::chrono::seconds request_timeout{6000};
  std::size_t max_idle_connections{20};
  std::size_t max_connections_per_host{256};

  // ---- MERGE RULES ----
  std::string resolve_stamp(const std::string& per_call) const;
  std::string resolve_redundancy(const std::string& per_call) const;
  bool resolve_pin(bool per_call) const;
};

} // namespace client
} // namespace blockstore

#endif // BLOCKSTORE_CLIENT_OPTIONS_HPP
