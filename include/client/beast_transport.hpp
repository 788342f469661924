#ifndef BLOCKSTORE_CLIENT_BEAST_TRANSPORT_HPP
#define BLOCKSTORE_CLIENT_BEAST_TRANSPORT_HPP

#include <chrono>
#include <string>
#include "client/http_transport.hpp"
#include "client/endpoint.hpp"
#include "client/client_options.hpp"
#include "client/connection_limiter.hpp"

namespace blockstore {
namespace client {

// Plain HTTP/1.1 transport on Boost.Beast.
// Every exchange opens its own connection, sends "Connection: close" and runs
// on a private io_context in the calling thread, so concurrent callers never
// share I/O state. The limiter bounds how many of those connections exist at
// once; extra callers queue for a slot.
class BeastTransport : public HttpTransport {
public:
  static constexpr const char* USER_AGENT = "blockstore-client/1.0";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BeastTransport(Endpoint endpoint, const ClientOptions& options);
  ~BeastTransport() override = default;

  BeastTransport(const BeastTransport&) = delete;
  BeastTransport& operator=(const BeastTransport&) = delete;


  // ---- EXCHANGE ----
  HttpResponse send(HttpRequest request, const CallOptions& options) override;


  // ---- GETTERS ----
  const Endpoint& endpoint() const { return endpoint_; }
  const ConnectionLimiter& limiter() const { return limiter_; }

private:
  // ---- PARAMETERS ----
  Endpoint endpoint_;
  std::chrono::seconds timeout_;
  ConnectionLimiter limiter_;
};

} // namespace client
} // namespace blockstore

#endif // BLOCKSTORE_CLIENT_BEAST_TRANSPORT_HPP
