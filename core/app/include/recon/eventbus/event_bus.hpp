#pragma once

#include "recon/events/event.hpp"

#include <cstddef>
#include <functional>
#include <limits>
#include <mutex>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace recon {

// Position of EventType among the alternatives of Event, at compile time.
template <typename EventType, typename Variant>
struct EventIndex;

template <typename EventType, typename... Rest>
struct EventIndex<EventType, std::variant<EventType, Rest...>>
    : std::integral_constant<std::size_t, 0> {};

template <typename EventType, typename First, typename... Rest>
struct EventIndex<EventType, std::variant<First, Rest...>>
    : std::integral_constant<
          std::size_t, 1 + EventIndex<EventType, std::variant<Rest...>>::value> {};

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Publish-subscribe channel from the reconciliation core to the
//         strategy layer.
//
// @details
// Publishers:
//   OrderRegistry  → OrderUpdateEvent (lifecycle transitions),
//                    OrderFilledEvent (one per applied trade id)
//   PositionLedger → FundingPaymentEvent (one per new settlement)
//
// A subscription is either typed (one Event alternative) or generic (all of
// them). Typed subscriptions are tagged with the alternative's index, so
// publish() only visits callbacks that want the event it carries.
//
// Thread model:
//   subscribe, unsubscribe and publish are safe from any thread. Callbacks
//   run synchronously on the publishing thread, which is the poll thread,
//   the stream thread or an order-entry caller. Publishers call publish()
//   only after releasing their own locks, so a callback may query the
//   registry or ledger without deadlocking.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Every published event. Returns the id to pass to unsubscribe().
  SubscriptionId subscribe(GenericCallback callback);

  // Only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // A publish() already in progress on another thread may still invoke the
  // callback once; later publishes will not. Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Invokes every matching callback before returning, in subscription
  // order. Matching callbacks are copied under the lock and run without it,
  // so a callback may itself subscribe, unsubscribe or publish.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  static constexpr std::size_t kAnyEvent = std::numeric_limits<std::size_t>::max();

  struct Subscriber {
    SubscriptionId id;
    std::size_t event_index;  // kAnyEvent for generic subscriptions
    GenericCallback callback;
  };

  SubscriptionId add(std::size_t event_index, GenericCallback callback);

  mutable std::mutex mutex_;  // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<Subscriber> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  constexpr std::size_t index = EventIndex<EventType, Event>::value;
  return add(index, [cb = std::move(callback)](const Event& event) {
    cb(std::get<EventType>(event));
  });
}

}  // namespace recon
