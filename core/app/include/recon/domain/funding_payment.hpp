#pragma once

#include <cstdint>
#include <string>

namespace recon {
namespace domain {

// -----------------------------------------------------------------------------
// FundingPayment
// -----------------------------------------------------------------------------
// Responsibility: the most recent funding settlement for one trading pair.
//
// @details
// "No payment" is a dedicated sentinel (timestamp 0, rate -1, payment -1),
// not a zero-amount payment. The exchange lists settlements that moved no
// money; reporting those as real transfers would double-report the period.
// -----------------------------------------------------------------------------
struct FundingPayment {
  std::string trading_pair;
  std::int64_t timestamp_ms{0};
  double funding_rate{-1.0};
  double payment{-1.0};

  static FundingPayment none(const std::string& trading_pair) {
    FundingPayment p;
    p.trading_pair = trading_pair;
    return p;
  }

  bool isPayment() const {
    return !(timestamp_ms == 0 && funding_rate == -1.0 && payment == -1.0);
  }
};

}  // namespace domain
}  // namespace recon
