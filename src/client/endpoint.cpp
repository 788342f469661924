#include "client/endpoint.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace blockstore {
namespace client {

namespace {

bool is_unreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
    c == '-' || c == '.' || c == '_' || c == '~';
}

std::string percent_encode(const std::string& value, bool keep_slash) {
  static const char HEX[] = "0123456789ABCDEF";
  std::string escaped;
  escaped.reserve(value.size());
  for (unsigned char c : value) {
    if (is_unreserved(c) || (keep_slash && c == '/')) {
      escaped.push_back(static_cast<char>(c));
    } else {
      escaped.push_back('%');
      escaped.push_back(HEX[c >> 4]);
      escaped.push_back(HEX[c & 0x0F]);
    }
  }
  return escaped;
}

} // namespace

std::string Endpoint::host_header() const {
  std::string name = host.find(':') == std::string::npos ? host : "[" + host + "]";
  return port == "80" ? name : name + ":" + port;
}

std::string Endpoint::target(const std::string& path) const {
  return base_path + path;
}

Endpoint parse_endpoint(const std::string& url) {
  const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    throw std::invalid_argument("Endpoint: Only http:// URLs are supported: " + url);
  }

  std::string rest = url.substr(scheme.size());
  Endpoint endpoint;

  std::size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    endpoint.base_path = rest.substr(slash);
    while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
      endpoint.base_path.pop_back();
    }
  }

  // Bracketed IPv6 literal, e.g. [::1]:1633
  std::size_t colon;
  if (!authority.empty() && authority.front() == '[') {
    std::size_t close = authority.find(']');
    if (close == std::string::npos) {
      throw std::invalid_argument("Endpoint: Malformed IPv6 host: " + url);
    }
    endpoint.host = authority.substr(1, close - 1);
    colon = authority.find(':', close);
  } else {
    colon = authority.find(':');
    endpoint.host = authority.substr(0, colon);
  }

  if (colon != std::string::npos) {
    endpoint.port = authority.substr(colon + 1);
    bool numeric = !endpoint.port.empty() &&
      std::all_of(endpoint.port.begin(), endpoint.port.end(),
                  [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!numeric) {
      throw std::invalid_argument("Endpoint: Invalid port in URL: " + url);
    }
  }

  if (endpoint.host.empty()) {
    throw std::invalid_argument("Endpoint: Missing host in URL: " + url);
  }
  return endpoint;
}

std::string escape_component(const std::string& value) {
  return percent_encode(value, false);
}

std::string escape_path(const std::string& path) {
  return percent_encode(path, true);
}

} // namespace client
} // namespace blockstore
