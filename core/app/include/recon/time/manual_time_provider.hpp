#pragma once

#include "recon/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace recon {

// -----------------------------------------------------------------------------
// ManualTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the owner last set.
//
// @details
// Used by tests that need deterministic local timestamps (order
// registration, implicit cancel timestamps, funding window start).
//
// Storage is a single std::atomic<int64_t>: tests set the time on the main
// thread while the poll scheduler thread reads it, and a lock-free atomic
// gives the needed visibility without a mutex.
// -----------------------------------------------------------------------------
class ManualTimeProvider final : public ITimeProvider {
 public:
  ManualTimeProvider() = default;
  explicit ManualTimeProvider(std::int64_t start_ms) : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Monotonicity is not enforced.
  void set_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new value.
  std::int64_t advance(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace recon
