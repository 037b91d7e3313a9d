#pragma once

#include <string>

namespace recon {
namespace domain {

// One collateral asset of the trading account. Every balance refresh is a
// full snapshot: assets missing from it are dropped from the ledger.
struct Balance {
  std::string asset;
  double total{0.0};
  double available{0.0};
};

}  // namespace domain
}  // namespace recon
