#include "recon/stream/zmq_stream_source.hpp"

namespace recon {

// -----------------------------------------------------------------------------
// Constructor: subscribe to everything, connect
// -----------------------------------------------------------------------------
ZmqStreamSource::ZmqStreamSource(const std::string& endpoint)
    : endpoint_(endpoint) {
  try {
    socket_.set(zmq::sockopt::subscribe, "");
    // Closing must not block on undelivered frames.
    socket_.set(zmq::sockopt::linger, 0);
    socket_.connect(endpoint_);
  } catch (const zmq::error_t& e) {
    throw StreamError("cannot connect stream socket to " + endpoint_ + ": " +
                      e.what());
  }
}

// -----------------------------------------------------------------------------
// next(): one frame or timeout
// -----------------------------------------------------------------------------
std::optional<std::string> ZmqStreamSource::next(
    std::chrono::milliseconds timeout) {
  const int timeout_ms = static_cast<int>(timeout.count());

  try {
    if (timeout_ms != current_timeout_ms_) {
      socket_.set(zmq::sockopt::rcvtimeo, timeout_ms);
      current_timeout_ms_ = timeout_ms;
    }

    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      return std::nullopt;
    }
    return msg.to_string();
  } catch (const zmq::error_t& e) {
    throw StreamError(std::string("stream recv failed: ") + e.what());
  }
}

}  // namespace recon
