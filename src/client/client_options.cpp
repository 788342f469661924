#include "client/client_options.hpp"

namespace blockstore {
namespace client {

std::string ClientOptions::resolve_stamp(const std::string& per_call) const {
  return per_call.empty() ? stamp : per_call;
}

std::string ClientOptions::resolve_redundancy(const std::string& per_call) const {
  return per_call.empty() ? redundancy : per_call;
}

bool ClientOptions::resolve_pin(bool per_call) const {
  return pin || per_call;
}

} // namespace client
} // namespace blockstore
