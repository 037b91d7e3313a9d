#include "recon/stream/queue_stream_source.hpp"

#include <iostream>
#include <utility>

namespace recon {

QueueStreamSource::QueueStreamSource(std::size_t capacity) : queue_(capacity) {}

PushResult QueueStreamSource::push(std::string frame) {
  const PushResult result = queue_.push(Item{std::move(frame), false});
  if (result == PushResult::DroppedOldest) {
    std::cerr << "[QueueStreamSource] WARNING: buffer full (" << queue_.capacity()
              << " frames). Oldest frame discarded.\n";
  }
  return result;
}

PushResult QueueStreamSource::injectFailure(std::string message) {
  return queue_.push(Item{std::move(message), true});
}

void QueueStreamSource::close() { queue_.close(); }

std::optional<std::string> QueueStreamSource::next(
    std::chrono::milliseconds timeout) {
  std::optional<Item> item = queue_.pop_for(timeout);
  if (!item) {
    if (queue_.closed()) {
      throw StreamError("stream source closed");
    }
    return std::nullopt;
  }
  if (item->failure) {
    throw StreamError(item->text);
  }
  return std::move(item->text);
}

}  // namespace recon
