#include "client/client_error.hpp"
#include <nlohmann/json.hpp>

namespace blockstore {
namespace client {

ErrorBody decode_error_body(const std::string& body) {
  nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return body;
  }

  auto message = parsed.find("message");
  if (message == parsed.end() || !message->is_string()) {
    return body;
  }

  ApiError error;
  error.message = message->get<std::string>();
  auto code = parsed.find("code");
  if (code != parsed.end() && code->is_number_integer()) {
    error.code = code->get<int>();
  }
  return error;
}

std::string error_message(const ErrorBody& body) {
  if (const auto* error = std::get_if<ApiError>(&body)) {
    return error->message;
  }
  return std::get<std::string>(body);
}

} // namespace client
} // namespace blockstore
