#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace recon {

// Which ingress produced a payload. Used for logging only: both channels go
// through identical merge semantics.
enum class Channel {
  Stream,
  Poll,
};

inline const char* toString(Channel channel) {
  return channel == Channel::Stream ? "stream" : "poll";
}

enum class MessageKind {
  OrderStatus,
  Trade,
  PositionSnapshot,
  BalanceSnapshot,
  FundingEvent,
};

inline const char* toString(MessageKind kind) {
  switch (kind) {
    case MessageKind::OrderStatus:      return "order-status";
    case MessageKind::Trade:            return "trade";
    case MessageKind::PositionSnapshot: return "position-snapshot";
    case MessageKind::BalanceSnapshot:  return "balance-snapshot";
    case MessageKind::FundingEvent:     return "funding-event";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// RawMessage
// -----------------------------------------------------------------------------
// One undecoded payload as handed over by the stream listener or the poll
// scheduler. payload is either a full REST response ({"result": ...} or
// {"error": ...}) or the "data" array of a stream message.
//
// The hints carry context the poller knows but the payload may omit:
//   trading_pair_hint     : pair a funding query was made for.
//   client_order_id_hint  : order a status query was made for (the exchange
//                           echoes the label, but may leave it empty).
// -----------------------------------------------------------------------------
struct RawMessage {
  Channel source{Channel::Stream};
  MessageKind kind{MessageKind::OrderStatus};
  nlohmann::json payload;
  std::string trading_pair_hint;
  std::string client_order_id_hint;
};

}  // namespace recon
