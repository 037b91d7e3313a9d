#pragma once

#include "recon/concurrent/bounded_queue.hpp"
#include "recon/stream/i_stream_source.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace recon {

// -----------------------------------------------------------------------------
// QueueStreamSource — in-process stream source
// -----------------------------------------------------------------------------
// Frames pushed from any thread are handed to the listener in FIFO order.
// When the buffer is full the oldest frame is discarded with a warning.
// injectFailure() queues a StreamError that next() throws when it reaches
// it, which lets tests exercise the listener's reconnect path. After
// close(), next() drains what is buffered and then throws StreamError on
// every call, like a connection that went away.
// -----------------------------------------------------------------------------
class QueueStreamSource final : public IStreamSource {
 public:
  static constexpr std::size_t kDefaultCapacity = 10'000;

  explicit QueueStreamSource(std::size_t capacity = kDefaultCapacity);

  PushResult push(std::string frame);
  PushResult injectFailure(std::string message);
  void close();

  std::optional<std::string> next(std::chrono::milliseconds timeout) override;

  std::size_t pending() const { return queue_.size(); }
  std::uint64_t dropped() const { return queue_.dropped(); }

 private:
  struct Item {
    std::string text;
    bool failure{false};
  };

  BoundedQueue<Item> queue_;
};

}  // namespace recon
