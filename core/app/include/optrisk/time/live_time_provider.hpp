#pragma once

#include "optrisk/time/i_time_provider.hpp"

namespace optrisk {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the server executable: a validation request without an explicit
// valuation_date is priced as of "now".
//
// Thread model:
//   std::chrono::system_clock::now() is safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace optrisk
