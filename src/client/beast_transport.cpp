#include "client/beast_transport.hpp"
#include "client/client_error.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/log/trivial.hpp>

namespace blockstore {
namespace client {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

// State of a single resolve/connect/write/read sequence.
// Handlers run on the io_context that owns the stream.
class Exchange {
public:
  Exchange(asio::io_context& io_context, const Endpoint& endpoint,
           HttpRequest request, std::chrono::seconds timeout)
    : resolver_(io_context)
    , resolve_timer_(io_context)
    , stream_(io_context)
    , endpoint_(endpoint)
    , request_(std::move(request))
    , timeout_(timeout) {
    // Blobs and archives routinely exceed Beast's default response limit
    parser_.body_limit(boost::none);
  }

  void start() {
    if (aborted_) {
      error_ = asio::error::operation_aborted;
      return;
    }
    // One deadline covers resolve, connect, write and read together
    deadline_ = std::chrono::steady_clock::now() + timeout_;
    resolve_timer_.expires_at(deadline_);
    resolve_timer_.async_wait([this](const beast::error_code& ec) { on_resolve_deadline(ec); });
    resolver_.async_resolve(endpoint_.host, endpoint_.port,
      [this](const beast::error_code& ec, tcp::resolver::results_type results) {
        on_resolve(ec, results);
      });
  }

  // Stops whatever step is in flight; must run on the io_context
  void abort() {
    aborted_ = true;
    resolve_timer_.cancel();
    resolver_.cancel();
    stream_.cancel();
  }

  const beast::error_code& error() const { return error_; }
  bool aborted() const { return aborted_; }
  HttpResponse release_response() { return parser_.release(); }

private:
  tcp::resolver resolver_;
  asio::steady_timer resolve_timer_;
  beast::tcp_stream stream_;
  const Endpoint& endpoint_;
  HttpRequest request_;
  std::chrono::seconds timeout_;
  std::chrono::steady_clock::time_point deadline_;
  beast::flat_buffer buffer_;
  http::response_parser<http::string_body> parser_;
  beast::error_code error_;
  bool aborted_{false};
  bool timed_out_{false};

  // A lookup already running in the resolver thread cannot be interrupted;
  // its result is discarded once the deadline has passed
  void on_resolve_deadline(const beast::error_code& ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    timed_out_ = true;
    resolver_.cancel();
  }

  void on_resolve(const beast::error_code& ec, const tcp::resolver::results_type& results) {
    resolve_timer_.cancel();
    if (std::chrono::steady_clock::now() >= deadline_) {
      timed_out_ = true;
    }
    if (failed(ec)) {
      return;
    }
    stream_.expires_at(deadline_);
    stream_.async_connect(results,
      [this](const beast::error_code& ec, const tcp::endpoint&) { on_connect(ec); });
  }

  void on_connect(const beast::error_code& ec) {
    if (failed(ec)) {
      return;
    }
    http::async_write(stream_, request_,
      [this](const beast::error_code& ec, std::size_t) { on_write(ec); });
  }

  void on_write(const beast::error_code& ec) {
    if (failed(ec)) {
      return;
    }
    http::async_read(stream_, buffer_, parser_,
      [this](const beast::error_code& ec, std::size_t) { on_read(ec); });
  }

  void on_read(const beast::error_code& ec) {
    if (failed(ec)) {
      return;
    }
    beast::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
  }

  bool failed(const beast::error_code& ec) {
    if (aborted_) {
      error_ = asio::error::operation_aborted;
      return true;
    }
    if (timed_out_) {
      error_ = beast::error::timeout;
      return true;
    }
    if (ec) {
      error_ = ec;
      return true;
    }
    return false;
  }
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BeastTransport::BeastTransport(Endpoint endpoint, const ClientOptions& options)
  : endpoint_(std::move(endpoint))
  , timeout_(options.request_timeout)
  , limiter_(options.max_connections_per_host) {
  BOOST_LOG_TRIVIAL(info) << "Beast transport: Targeting " << endpoint_.host_header()
                          << endpoint_.base_path << " (max " << options.max_connections_per_host
                          << " connections, " << options.max_idle_connections << " idle, timeout "
                          << timeout_.count() << "s)";
}


//==============================================
// EXCHANGE
//==============================================

HttpResponse BeastTransport::send(HttpRequest request, const CallOptions& options) {
  Context* context = options.context;
  const std::string description =
    std::string(request.method_string()) + " " + std::string(request.target());

  if (context && context->is_cancelled()) {
    BOOST_LOG_TRIVIAL(debug) << "Beast transport: " << description << " cancelled before sending";
    throw CancelledError("Beast transport: Request cancelled: " + description);
  }

  request.set(http::field::host, endpoint_.host_header());
  request.set(http::field::user_agent, USER_AGENT);
  request.keep_alive(false);
  request.prepare_payload();

  if (options.local_redundancy) {
    BOOST_LOG_TRIVIAL(trace) << "Beast transport: " << description << " processed locally with redundancy "
                             << swarm::redundancy_level_name(*options.local_redundancy);
  }

  auto slot = limiter_.acquire();
  BOOST_LOG_TRIVIAL(debug) << "Beast transport: Sending " << description;

  asio::io_context io_context;
  Exchange exchange(io_context, endpoint_, std::move(request), timeout_);

  Context::Registration registration;
  if (context) {
    registration = context->on_cancel([&io_context, &exchange]() {
      asio::post(io_context, [&exchange]() { exchange.abort(); });
    });
  }

  exchange.start();
  io_context.run();
  registration = Context::Registration();

  if (exchange.error()) {
    if (exchange.aborted()) {
      BOOST_LOG_TRIVIAL(info) << "Beast transport: " << description << " cancelled";
      throw CancelledError("Beast transport: Request cancelled: " + description);
    }
    BOOST_LOG_TRIVIAL(error) << "Beast transport: " << description << " failed: " << exchange.error().message();
    throw TransportError("Beast transport: " + description + ": " + exchange.error().message());
  }

  HttpResponse response = exchange.release_response();
  BOOST_LOG_TRIVIAL(debug) << "Beast transport: " << description << " -> " << response.result_int()
                           << " (" << response.body().size() << " bytes)";
  return response;
}

} // namespace client
} // namespace blockstore
