#pragma once

#include <cstdint>

namespace optrisk {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract valuation clock
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that supplies "today" to the risk engine.
//
// @details
// Every time-dependent quantity in the engine (time-to-expiry for pricing,
// days-to-expiry for the early assignment check, the probability horizon)
// is measured from the valuation instant. Reading std::chrono directly
// inside the calculators would make results drift with the wall clock and
// make tests non-reproducible.
//
// Implementations:
//   - LiveTimeProvider   → delegates to std::chrono::system_clock.
//   - FixedTimeProvider  → returns a value pinned by the caller (tests,
//                          what-if analysis on a chosen date).
//
// A validation request may also carry its own valuation date; in that case
// the provider is not consulted at all.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. The IPC worker thread
//   reads the clock while the main thread may re-pin a FixedTimeProvider.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the valuation instant as milliseconds since the Unix
  //         epoch (1970-01-01 00:00:00 UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace optrisk
