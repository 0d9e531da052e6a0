#pragma once

#include "optrisk/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace optrisk {

// -----------------------------------------------------------------------------
// FixedTimeProvider — caller-pinned valuation clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly instead of
//         read from the system clock.
//
// @details
// Pricing and probability results depend on time-to-expiry, so a test that
// uses the wall clock would produce different Greeks every day. Pinning the
// clock makes every computation reproducible: identical snapshot plus
// identical clock gives bit-identical output.
//
// Also used for what-if runs ("how does this book look next Friday?").
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_. Lock-free on 64-bit platforms, so
//   the IPC worker can read it while the owner re-pins it.
// -----------------------------------------------------------------------------
class FixedTimeProvider final : public ITimeProvider {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  initial_ms  Epoch milliseconds the clock starts at. Defaults to
  //                     0, i.e. 1970-01-01, which no real expiry precedes,
  //                     so callers are expected to pin a meaningful date.
  // -------------------------------------------------------------------------
  explicit FixedTimeProvider(std::int64_t initial_ms = 0)
      : current_time_ms_(initial_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // set_time_ms(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Pins the clock to the given instant. Monotonicity is not
  //         enforced; what-if analysis may move the clock backwards.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  void set_time_ms(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace optrisk
