#include "optrisk/time/fixed_time_provider.hpp"

namespace optrisk {

// -----------------------------------------------------------------------------
// now_ms(): atomic read of the pinned clock
// -----------------------------------------------------------------------------
std::int64_t FixedTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// set_time_ms(): atomic write; no monotonicity check (what-if runs rewind)
// -----------------------------------------------------------------------------
void FixedTimeProvider::set_time_ms(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

}  // namespace optrisk
