#pragma once

#include "recon/domain/fill.hpp"
#include "recon/domain/order.hpp"

namespace recon {

// Published by the OrderRegistry once per applied trade id. order is the
// snapshot after the fill was accumulated.
struct OrderFilledEvent {
  domain::Fill fill;
  domain::Order order;
};

}  // namespace recon
