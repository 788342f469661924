#ifndef BLOCKSTORE_CLIENT_CONTEXT_HPP
#define BLOCKSTORE_CLIENT_CONTEXT_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace blockstore {
namespace client {

// Cancellation handle passed along with a request.
// cancel() may be called from any thread; registered handlers run on the
// cancelling thread and must not block.
class Context {
public:
  using CancelHandler = std::function<void()>;

  // Keeps a handler registered for its lifetime
  class Registration {
  public:
    Registration() = default;
    Registration(Context* context, std::uint64_t id) : context_(context), id_(id) {}
    Registration(Registration&& other) noexcept;
    Registration& operator=(Registration&& other) noexcept;
    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;
    ~Registration();

  private:
    Context* context_{nullptr};
    std::uint64_t id_{0};

    void reset();
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Context() = default;
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;


  // ---- CANCELLATION ----
  void cancel();
  bool is_cancelled() const { return cancelled_; }
  // Runs the handler on cancel, or right away if already cancelled
  Registration on_cancel(CancelHandler handler);

private:
  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  std::atomic<bool> cancelled_{false};
  std::uint64_t next_id_{1};
  std::map<std::uint64_t, CancelHandler> handlers_;

  void remove(std::uint64_t id);
};

} // namespace client
} // namespace blockstore

#endif // BLOCKSTORE_CLIENT_CONTEXT_HPP
