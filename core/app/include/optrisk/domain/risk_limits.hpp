#pragma once

#include "optrisk/domain/types.hpp"

namespace optrisk {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — thresholds applied by RiskValidator
// -----------------------------------------------------------------------------
//
// @brief  Portfolio Greeks caps plus the warning thresholds of the softer
//         checks.
//
// @details
// Greeks caps compare against the absolute combined (existing + candidate)
// exposure. Exceeding a cap is a BLOCKER; delta additionally warns once it
// passes delta_warning_fraction of its cap.
//
// Capital: a debit larger than the cash balance blocks; a debit above
// capital_warning_fraction of cash warns.
//
// Minimum probability of profit is chosen by RiskProfile.
//
// Defaults match the production desk settings. EngineConfig can override
// every field from JSON; values are validated at load time.
//
// Thread model:
//   Plain data, copied into RiskValidator at construction.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Caps on |combined Greeks| (exposure units).
  double max_delta{200.0};
  double max_gamma{20.0};
  double max_vega{500.0};
  double max_theta{100.0};

  /// Fraction of max_delta above which delta warns.
  double delta_warning_fraction{0.8};

  /// Fraction of cash above which a debit warns.
  double capital_warning_fraction{0.5};

  /// Minimum PoP (percent) per risk profile.
  double min_pop_conservative{70.0};
  double min_pop_moderate{60.0};
  double min_pop_aggressive{50.0};

  /// IV rank (percent) below which selling premium warns.
  double min_iv_rank_for_credit{50.0};

  /// Existing legs on one symbol above which concentration warns.
  int max_legs_per_symbol{3};

  /// Legs sharing one expiry above which concentration warns.
  int max_legs_per_expiry{5};

  /// Legs sharing one (symbol, strike) above which concentration warns.
  int max_legs_per_strike{3};

  /// Short legs in the money closer than this many days warn.
  int early_assignment_days{7};

  double minPop(RiskProfile profile) const {
    switch (profile) {
      case RiskProfile::Conservative: return min_pop_conservative;
      case RiskProfile::Moderate:     return min_pop_moderate;
      case RiskProfile::Aggressive:   return min_pop_aggressive;
    }
    return min_pop_moderate;
  }
};

}  // namespace domain
}  // namespace optrisk
