#ifndef BLOCKSTORE_CLIENT_ENDPOINT_HPP
#define BLOCKSTORE_CLIENT_ENDPOINT_HPP

#include <string>

namespace blockstore {
namespace client {

// Base URL of the node split into the parts a request needs
struct Endpoint {
  std::string host;
  std::string port{"80"};
  // Path prefix prepended to every API path, without trailing '/'
  std::string base_path;

  // Value for the Host header
  std::string host_header() const;
  // Full request target for an API path
  std::string target(const std::string& path) const;
};

// Parses "http://host[:port][/prefix]"
// Throws std::invalid_argument for other schemes or malformed URLs
Endpoint parse_endpoint(const std::string& url);

// ---- ESCAPING ----
// Percent-encodes every byte outside the RFC 3986 unreserved set, for a
// single path segment or a query value
std::string escape_component(const std::string& value);
// Same as escape_component but keeps '/' so nested names stay nested
std::string escape_path(const std::string& path);

} // namespace client
} // namespace blockstore

#endif // BLOCKSTORE_CLIENT_ENDPOINT_HPP
