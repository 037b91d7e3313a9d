#pragma once

#include "recon/events/funding_payment_event.hpp"
#include "recon/events/order_filled_event.hpp"
#include "recon/events/order_update_event.hpp"

#include <variant>

namespace recon {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Notification envelope carried by the EventBus to the strategy layer. Value
// semantics, so a subscriber can copy an event onto its own queue and
// process it on another thread.
// -----------------------------------------------------------------------------
using Event = std::variant<
    OrderUpdateEvent,
    OrderFilledEvent,
    FundingPaymentEvent>;

}  // namespace recon
