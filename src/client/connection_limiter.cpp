#include "client/connection_limiter.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace blockstore {
namespace client {

ConnectionLimiter::Slot::~Slot() {
  if (limiter_) {
    limiter_->release();
  }
}

ConnectionLimiter::ConnectionLimiter(std::size_t max_connections)
  : max_connections_(max_connections) {
  if (max_connections_ == 0) {
    throw std::invalid_argument("Connection limiter: At least one connection must be allowed");
  }
}

ConnectionLimiter::Slot ConnectionLimiter::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (active_ >= max_connections_) {
    BOOST_LOG_TRIVIAL(debug) << "Connection limiter: All " << max_connections_
                             << " connections busy, waiting for a free slot";
    ++waiting_;
    slot_freed_.wait(lock, [this] { return active_ < max_connections_; });
    --waiting_;
  }
  ++active_;
  return Slot(this);
}

std::size_t ConnectionLimiter::active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

std::size_t ConnectionLimiter::waiting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return waiting_;
}

void ConnectionLimiter::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --active_;
  }
  slot_freed_.notify_one();
}

} // namespace client
} // namespace blockstore
