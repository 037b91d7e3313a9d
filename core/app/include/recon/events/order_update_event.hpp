#pragma once

#include "recon/domain/order.hpp"
#include "recon/domain/order_state.hpp"

namespace recon {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
// @brief  Published by the OrderRegistry after every lifecycle transition.
//
// @details
// order is a full copy taken after the transition was applied;
// previous_state is the state it left. Registration itself publishes an
// event with previous_state == PendingCreate and order.state ==
// PendingCreate.
//
// Published on whichever thread applied the transition (stream listener,
// poll scheduler or order submitter), always after the registry lock has
// been released.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderState previous_state{domain::OrderState::PendingCreate};
};

}  // namespace recon
