#pragma once

#include "recon/domain/funding_payment.hpp"

namespace recon {

// Published by the PositionLedger when a new (non-sentinel) funding
// settlement is recorded for a pair. Never published for the "no payment"
// sentinel.
struct FundingPaymentEvent {
  domain::FundingPayment payment;
};

}  // namespace recon
