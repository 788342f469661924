#ifndef BLOCKSTORE_CLIENT_CONNECTION_LIMITER_HPP
#define BLOCKSTORE_CLIENT_CONNECTION_LIMITER_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace blockstore {
namespace client {

// Caps the number of connections open to the node at the same time.
// Callers beyond the cap wait for a slot instead of failing.
class ConnectionLimiter {
public:
  // Holds one connection slot until destroyed
  class Slot {
  public:
    explicit Slot(ConnectionLimiter* limiter) : limiter_(limiter) {}
    Slot(Slot&& other) noexcept : limiter_(other.limiter_) { other.limiter_ = nullptr; }
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot& operator=(Slot&&) = delete;
    ~Slot();

  private:
    ConnectionLimiter* limiter_;
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ConnectionLimiter(std::size_t max_connections);


  // ---- SLOT MANAGEMENT ----
  // Blocks until a slot is free
  Slot acquire();


  // ---- QUERY OPERATIONS ----
  std::size_t max_connections() const { return max_connections_; }
  std::size_t active() const;
  std::size_t waiting() const;

private:
  // ---- PARAMETERS ----
  const std::size_t max_connections_;
  mutable std::mutex mutex_;
  std::condition_variable slot_freed_;
  std::size_t active_{0};
  std::size_t waiting_{0};

  void release();
};

} // namespace client
} // namespace blockstore

#endif // BLOCKSTORE_CLIENT_CONNECTION_LIMITER_HPP
