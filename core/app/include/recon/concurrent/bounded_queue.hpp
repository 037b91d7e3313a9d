#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace recon {

// Result of BoundedQueue::push().
enum class PushResult {
  Accepted,       // Queued, nothing lost
  DroppedOldest,  // Queue was full; the oldest item was discarded to make room
  Closed,         // Queue is closed; the item was discarded
};

// -----------------------------------------------------------------------------
// BoundedQueue<T>
// -----------------------------------------------------------------------------
//
// @brief  Multi-producer / multi-consumer FIFO with a fixed capacity and an
//         explicit close().
//
// @details
// Sits between the thread that receives stream frames and the
// StreamListener thread (see QueueStreamSource). A producer never blocks:
// when the queue is full the oldest frame is discarded. Losing a stream
// frame is recoverable because the poll scheduler re-reads the same facts;
// stalling the receiving side is not.
//
// close() wakes every waiting consumer. After close(), push() discards its
// item and pop_for() still drains what is left, then returns std::nullopt
// without waiting.
//
// Thread model: every method may be called from any thread.
// -----------------------------------------------------------------------------
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("BoundedQueue capacity must be positive");
    }
  }

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;
  BoundedQueue(BoundedQueue&&) = delete;
  BoundedQueue& operator=(BoundedQueue&&) = delete;

  PushResult push(T value) {
    PushResult result = PushResult::Accepted;
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return PushResult::Closed;
      }
      if (items_.size() == capacity_) {
        items_.pop_front();
        ++dropped_;
        result = PushResult::DroppedOldest;
      }
      items_.push_back(std::move(value));
    }
    ready_.notify_one();
    return result;
  }

  // Front item, or nullopt if nothing arrived within timeout. Returns
  // immediately once the queue is closed and drained.
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    ready_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
    return takeLocked();
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    return takeLocked();
  }

  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    ready_.notify_all();
  }

  bool closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

  std::size_t capacity() const { return capacity_; }

  // Items discarded by push() on overflow since construction.
  std::uint64_t dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  std::optional<T> takeLocked() {
    if (items_.empty()) {
      return std::nullopt;
    }
    std::optional<T> value{std::move(items_.front())};
    items_.pop_front();
    return value;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;       // Guards everything below
  std::condition_variable ready_;  // Signalled on push and close
  std::deque<T> items_;
  std::uint64_t dropped_{0};
  bool closed_{false};
};

}  // namespace recon
