#ifndef BLOCKSTORE_CLIENT_HTTP_TRANSPORT_HPP
#define BLOCKSTORE_CLIENT_HTTP_TRANSPORT_HPP

#include <optional>
#include <boost/beast/http.hpp>
#include "client/context.hpp"
#include "swarm/redundancy.hpp"

namespace blockstore {
namespace client {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Per-call settings that travel with a request but are not sent on the wire
struct CallOptions {
  // Cancels the exchange when triggered; null for uncancellable calls
  Context* context{nullptr};
  // Redundancy level for the client's own processing of the request.
  // Independent of the Swarm-Redundancy-Level header sent to the node.
  std::optional<swarm::RedundancyLevel> local_redundancy;
};

// One request/response exchange with the node.
// Implementations set Host and connection headers and return the full
// response with its body read. Failures to exchange throw TransportError,
// or CancelledError when the call's context was cancelled.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse send(HttpRequest request, const CallOptions& options) = 0;

protected:
  HttpTransport() = default;
};

} // namespace client
} // namespace blockstore

#endif // BLOCKSTORE_CLIENT_HTTP_TRANSPORT_HPP
