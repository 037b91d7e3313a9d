#pragma once

#include <cstdint>

namespace recon {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" away from std::chrono::system_clock so the
//         poll scheduler, the registry and the funding window computation can
//         be driven by a manual clock in tests.
//
// @details
// Implementations:
//   - LiveTimeProvider   → std::chrono::system_clock.
//   - ManualTimeProvider → value set explicitly by the caller.
//
// Components receive `const ITimeProvider&` and call now_ms() whenever they
// need a local timestamp (order registration, implicit cancellations,
// funding window start). Exchange-reported timestamps never go through it.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds. Safe to call concurrently from any thread.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace recon
