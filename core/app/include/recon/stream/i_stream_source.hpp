#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace recon {

// The connection behind a stream source broke. The listener logs it, waits
// stream_retry_delay_ms and keeps reading.
class StreamError : public std::runtime_error {
 public:
  explicit StreamError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// IStreamSource — text frames from the exchange's private push channel
// -----------------------------------------------------------------------------
// next() blocks for at most `timeout` and returns one frame, or nullopt if
// none arrived. Throws StreamError when the underlying connection fails.
// Authentication and channel subscription are the source's business; the
// listener only sees the JSON text frames.
// -----------------------------------------------------------------------------
class IStreamSource {
 public:
  virtual ~IStreamSource() = default;

  virtual std::optional<std::string> next(std::chrono::milliseconds timeout) = 0;
};

}  // namespace recon
