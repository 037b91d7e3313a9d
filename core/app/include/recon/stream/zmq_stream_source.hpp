#pragma once

#include "recon/stream/i_stream_source.hpp"

#include <zmq.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace recon {

// -----------------------------------------------------------------------------
// ZmqStreamSource — stream frames from a ZeroMQ PUB endpoint
// -----------------------------------------------------------------------------
//
// @brief  SUB socket connected to the process that holds the exchange's
//         authenticated private channel and republishes its frames.
//
// @details
// The socket subscribes to every topic and uses ZMQ_RCVTIMEO so that next()
// returns within the requested timeout even when nothing is published. The
// timeout is reapplied only when it changes between calls.
//
// ZeroMQ reconnects SUB sockets on its own; a zmq::error_t surfacing from
// recv() (context terminated, socket closed) is reported as StreamError.
//
// Thread model:
//   zmq::socket_t is not thread-safe. next() must only be called from the
//   stream listener thread.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t (RAII).
// -----------------------------------------------------------------------------
class ZmqStreamSource final : public IStreamSource {
 public:
  explicit ZmqStreamSource(const std::string& endpoint);

  ZmqStreamSource(const ZmqStreamSource&) = delete;
  ZmqStreamSource& operator=(const ZmqStreamSource&) = delete;

  std::optional<std::string> next(std::chrono::milliseconds timeout) override;

  const std::string& endpoint() const { return endpoint_; }

 private:
  std::string endpoint_;
  int current_timeout_ms_{-1};

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};
};

}  // namespace recon
