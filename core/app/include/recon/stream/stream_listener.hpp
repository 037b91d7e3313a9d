#pragma once

#include "recon/config/connector_config.hpp"
#include "recon/reconciliation/reconciliation_engine.hpp"
#include "recon/stream/i_stream_source.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace recon {

// -----------------------------------------------------------------------------
// StreamListener — push-channel ingress
// -----------------------------------------------------------------------------
//
// @brief  Reads frames from an IStreamSource on a dedicated thread, routes
//         them by channel and hands them to
//         ReconciliationEngine::onStreamEvent().
//
// @details
// Frame shape: {"channel": "<account_id>.<topic>", "data": [...]}
//   "<account_id>.orders" → MessageKind::OrderStatus
//   "<account_id>.trades" → MessageKind::Trade
// Frames that are not JSON, have no channel, or name an unknown channel are
// logged and counted as rejected. A frame with null or missing data is
// accepted and applies nothing.
//
// Failure handling:
//   StreamError from the source is logged, counted, and followed by a wait
//   of stream_retry_delay_ms (interruptible by stop()) before reading again.
//   The poll scheduler keeps the state correct meanwhile.
//
// Thread model:
//   start() spawns one reader thread, mirroring the market data thread
//   pattern: the source's next() blocks for at most stream_poll_timeout_ms
//   so the running_ flag is re-checked regularly. processFrame() is public
//   and can be driven synchronously.
//
// Ownership:
//   Owned by ConnectorCore. Borrows the engine, the source and the config.
// -----------------------------------------------------------------------------
class StreamListener {
 public:
  StreamListener(ReconciliationEngine& engine, IStreamSource& source,
                 const config::ConnectorConfig& config);

  ~StreamListener();

  StreamListener(const StreamListener&) = delete;
  StreamListener& operator=(const StreamListener&) = delete;
  StreamListener(StreamListener&&) = delete;
  StreamListener& operator=(StreamListener&&) = delete;

  // Routes one text frame. Returns false if the frame was rejected before
  // reaching the engine.
  bool processFrame(const std::string& text);

  void start();
  void stop();

  bool running() const { return running_.load(); }

  std::uint64_t framesProcessed() const { return frames_processed_.load(); }
  std::uint64_t framesRejected() const { return frames_rejected_.load(); }
  std::uint64_t streamErrors() const { return stream_errors_.load(); }

 private:
  void run();

  ReconciliationEngine& engine_;
  IStreamSource& source_;
  const config::ConnectorConfig& config_;
  const std::string orders_channel_;
  const std::string trades_channel_;

  std::atomic<bool> running_{false};
  std::mutex retry_mutex_;
  std::condition_variable retry_cv_;
  std::thread thread_;

  std::atomic<std::uint64_t> frames_processed_{0};
  std::atomic<std::uint64_t> frames_rejected_{0};
  std::atomic<std::uint64_t> stream_errors_{0};
};

}  // namespace recon
