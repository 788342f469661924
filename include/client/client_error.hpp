#ifndef BLOCKSTORE_CLIENT_ERROR_HPP
#define BLOCKSTORE_CLIENT_ERROR_HPP

#include <stdexcept>
#include <string>
#include <variant>

namespace blockstore {
namespace client {

// Structured error payload returned by the node: {"code": int, "message": string}
struct ApiError {
  int code{0};
  std::string message;
};

// Error body of a failed response: either the decoded payload or the raw text
using ErrorBody = std::variant<ApiError, std::string>;

// Decodes a failed response body; falls back to the raw text when it is
// not a JSON object carrying a string "message"
ErrorBody decode_error_body(const std::string& body);

// Message to report for an error body
std::string error_message(const ErrorBody& body);


class ClientError : public std::runtime_error {
public:
  explicit ClientError(const std::string& message) : std::runtime_error(message) {}
};

// Connection, resolve and timeout failures
class TransportError : public ClientError {
public:
  explicit TransportError(const std::string& message) : ClientError(message) {}
};

// The caller cancelled the request through its Context
class CancelledError : public TransportError {
public:
  explicit CancelledError(const std::string& message) : TransportError(message) {}
};

// A success response whose body or headers could not be decoded
class DecodeError : public ClientError {
public:
  explicit DecodeError(const std::string& message) : ClientError(message) {}
};

// The node answered with a non-success status
class ResponseError : public ClientError {
public:
  ResponseError(unsigned status_code, ErrorBody body)
    : ClientError(error_message(body))
    , status_code_(status_code)
    , body_(std::move(body)) {}

  unsigned status_code() const { return status_code_; }
  const ErrorBody& body() const { return body_; }

private:
  unsigned status_code_;
  ErrorBody body_;
};

// Invalid arguments detected before any request was sent
class PreconditionError : public ClientError {
public:
  explicit PreconditionError(const std::string& message) : ClientError(message) {}
};

} // namespace client
} // namespace blockstore

#endif // BLOCKSTORE_CLIENT_ERROR_HPP
