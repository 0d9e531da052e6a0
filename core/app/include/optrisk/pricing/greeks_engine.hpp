#pragma once

#include "optrisk/domain/greeks.hpp"
#include "optrisk/domain/option_leg.hpp"
#include "optrisk/pricing/black_scholes.hpp"
#include "optrisk/pricing/pricing_config.hpp"

#include <cstdint>
#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// GreeksEngine — position Greeks for option legs
// -----------------------------------------------------------------------------
//
// @brief  Prices each leg with BlackScholes and scales its exposure Greeks
//         to the size and direction of the position.
//
// @details
// For a leg:
//   greeks = exposure(leg) * (+1 BUY / -1 SELL) * quantity * 100
//
// Time to expiry is whole calendar days from the valuation day to the
// expiry day, over 365. No clamping: an expired leg prices at intrinsic.
//
// aggregate() is the plain sum of legGreeks(), so the Greeks of a book are
// additive by construction.
//
// Thread-safety: Immutable after construction; safe to share.
// -----------------------------------------------------------------------------
class GreeksEngine {
 public:
  static constexpr double kContractMultiplier = 100.0;

  explicit GreeksEngine(PricingConfig config = {}) : config_(config) {}

  // Per-share valuation of the leg at valuation_ms (raw units).
  OptionValuation valueLeg(const domain::OptionLeg& leg,
                           std::int64_t valuation_ms) const;

  // Per-share value of the leg at an arbitrary spot and day.
  double valueAt(const domain::OptionLeg& leg, double spot,
                 std::int64_t valuation_day) const;

  domain::GreeksVector legGreeks(const domain::OptionLeg& leg,
                                 std::int64_t valuation_ms) const;

  domain::GreeksVector aggregate(const std::vector<domain::OptionLeg>& legs,
                                 std::int64_t valuation_ms) const;

  const PricingConfig& config() const { return config_; }

 private:
  PricingInputs inputsFor(const domain::OptionLeg& leg, double spot,
                          std::int64_t valuation_day) const;

  PricingConfig config_;
};

}  // namespace optrisk
