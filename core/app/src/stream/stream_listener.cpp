#include "recon/stream/stream_listener.hpp"
#include "recon/normalizer/raw_message.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace recon {

StreamListener::StreamListener(ReconciliationEngine& engine,
                               IStreamSource& source,
                               const config::ConnectorConfig& config)
    : engine_(engine),
      source_(source),
      config_(config),
      orders_channel_(config.account_id + ".orders"),
      trades_channel_(config.account_id + ".trades") {}

StreamListener::~StreamListener() { stop(); }

// -----------------------------------------------------------------------------
// processFrame: parse, route by channel, apply
// -----------------------------------------------------------------------------
bool StreamListener::processFrame(const std::string& text) {
  nlohmann::json frame;
  try {
    frame = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "[StreamListener] JSON parse error: " << e.what()
              << ". Frame: " << text << "\n";
    ++frames_rejected_;
    return false;
  }

  if (!frame.is_object() || !frame.contains("channel") ||
      !frame.at("channel").is_string()) {
    std::cerr << "[StreamListener] WARNING: frame without channel: " << text
              << "\n";
    ++frames_rejected_;
    return false;
  }

  const std::string& channel = frame.at("channel").get_ref<const std::string&>();
  RawMessage raw;
  raw.source = Channel::Stream;
  if (channel == orders_channel_) {
    raw.kind = MessageKind::OrderStatus;
  } else if (channel == trades_channel_) {
    raw.kind = MessageKind::Trade;
  } else {
    std::cerr << "[StreamListener] ERROR: unexpected message in user stream: "
              << text << "\n";
    ++frames_rejected_;
    return false;
  }

  ++frames_processed_;
  auto data = frame.find("data");
  if (data == frame.end() || data->is_null()) {
    return true;
  }

  raw.payload = std::move(*data);
  const ApplySummary summary = engine_.onStreamEvent(raw);

  if (config_.debug_logging) {
    std::cout << "[StreamListener] DEBUG: " << channel
              << " applied=" << summary.applied
              << " ignored=" << summary.ignored
              << " deferred=" << summary.deferred
              << " dropped=" << summary.dropped
              << " failed=" << summary.failed << "\n";
  }
  return true;
}

// -----------------------------------------------------------------------------
// start / stop
// -----------------------------------------------------------------------------
void StreamListener::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] {
    std::cout << "[StreamListener] listening on " << orders_channel_ << ", "
              << trades_channel_ << "\n";
    run();
    std::cout << "[StreamListener] read loop exited.\n";
  });
}

void StreamListener::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(retry_mutex_);
    running_.store(false);
  }
  retry_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): read loop with retry delay on stream failure
// -----------------------------------------------------------------------------
void StreamListener::run() {
  const auto poll_timeout =
      std::chrono::milliseconds(config_.stream_poll_timeout_ms);
  const auto retry_delay =
      std::chrono::milliseconds(config_.stream_retry_delay_ms);

  while (running_.load()) {
    try {
      auto frame = source_.next(poll_timeout);
      if (!frame) {
        continue;
      }
      processFrame(*frame);
    } catch (const StreamError& e) {
      ++stream_errors_;
      std::cerr << "[StreamListener] WARNING: stream failure: " << e.what()
                << ". Reconnecting in " << retry_delay.count() << " ms.\n";
      std::unique_lock lock(retry_mutex_);
      retry_cv_.wait_for(lock, retry_delay,
                         [this] { return !running_.load(); });
    } catch (const std::exception& e) {
      std::cerr << "[StreamListener] ERROR: unexpected error in read loop: "
                << e.what() << "\n";
    }
  }
}

}  // namespace recon
