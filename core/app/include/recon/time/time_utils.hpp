#pragma once

#include <cmath>
#include <cstdint>

namespace recon {

// -----------------------------------------------------------------------------
// Time helpers
// -----------------------------------------------------------------------------
// The exchange reports most timestamps in epoch milliseconds, but a few
// endpoints (funding history, order creation) use seconds, possibly
// fractional. Everything is normalized to int64 milliseconds internally.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMsPerSecond = 1000;
constexpr std::int64_t kMsPerHour = 3600 * kMsPerSecond;

inline std::int64_t seconds_to_ms(double seconds) {
  return static_cast<std::int64_t>(std::llround(seconds * 1000.0));
}

// Start of the hour before the one containing now_ms. Funding settles
// hourly; querying from here always covers the last completed settlement.
inline std::int64_t previous_hour_start_ms(std::int64_t now_ms) {
  return ((now_ms / kMsPerHour) - 1) * kMsPerHour;
}

}  // namespace recon
