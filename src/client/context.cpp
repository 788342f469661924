#include "client/context.hpp"
#include <boost/log/trivial.hpp>

namespace blockstore {
namespace client {

//==============================================
// REGISTRATION
//==============================================

Context::Registration::Registration(Registration&& other) noexcept
  : context_(other.context_)
  , id_(other.id_) {
  other.context_ = nullptr;
}

Context::Registration& Context::Registration::operator=(Registration&& other) noexcept {
  if (this != &other) {
    reset();
    context_ = other.context_;
    id_ = other.id_;
    other.context_ = nullptr;
  }
  return *this;
}

Context::Registration::~Registration() {
  reset();
}

void Context::Registration::reset() {
  if (context_) {
    context_->remove(id_);
    context_ = nullptr;
  }
}


//==============================================
// CANCELLATION
//==============================================

void Context::cancel() {
  // Handlers run under the lock so a concurrent Registration teardown waits for them
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_.exchange(true)) {
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Context: Cancelling " << handlers_.size() << " pending operation(s)";
  for (auto& entry : handlers_) {
    entry.second();
  }
  handlers_.clear();
}

Context::Registration Context::on_cancel(CancelHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_) {
    handler();
    return Registration();
  }

  std::uint64_t id = next_id_++;
  handlers_.emplace(id, std::move(handler));
  return Registration(this, id);
}

void Context::remove(std::uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.erase(id);
}

} // namespace client
} // namespace blockstore
