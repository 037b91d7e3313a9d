#include "recon/time/manual_time_provider.hpp"

namespace recon {

std::int64_t ManualTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void ManualTimeProvider::set_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

std::int64_t ManualTimeProvider::advance(std::int64_t delta_ms) {
  return current_time_ms_.fetch_add(delta_ms) + delta_ms;
}

}  // namespace recon
