#pragma once

#include "optrisk/domain/option_leg.hpp"
#include "optrisk/pricing/greeks_engine.hpp"

#include <cstdint>
#include <vector>

namespace optrisk {

struct PnlPoint {
  double price{0.0};
  double pnl{0.0};
};

// -----------------------------------------------------------------------------
// PayoffProfile — net dollar P&L of a leg set at its horizon
// -----------------------------------------------------------------------------
//
// @brief  Maps an underlying price S_T at the horizon to the P&L of the
//         whole position, premiums included.
//
// @details
// The horizon is the earliest leg expiry. At that day:
//
//   leg expiring at the horizon   sign * q * (100 * intrinsic(S_T) - premium)
//   leg expiring later            sign * q * (100 * BS(S_T, τ_left) - premium)
//
// where premium is the per-contract price paid or received and BS is the
// Black-Scholes value with the leg's own volatility and the days left after
// the horizon. For a same-expiry position this is the usual piecewise-linear
// expiration payoff.
//
// Ownership:
//   Holds copies of the legs and of the pricer, so it may outlive both.
// -----------------------------------------------------------------------------
class PayoffProfile {
 public:
  // @throws InputError if legs is empty.
  PayoffProfile(std::vector<domain::OptionLeg> legs, GreeksEngine pricer);

  double pnlAt(double price) const;

  // -------------------------------------------------------------------------
  // markedPnlAt(price, valuation_day)
  // -------------------------------------------------------------------------
  // @brief  P&L if every leg were marked with Black-Scholes at price on
  //         valuation_day. Legs expired by then count at intrinsic value.
  // -------------------------------------------------------------------------
  double markedPnlAt(double price, std::int64_t valuation_day) const;

  // -------------------------------------------------------------------------
  // sample(lo, hi, points)
  // -------------------------------------------------------------------------
  // @brief  Evenly spaced P&L curve over [lo, hi], both ends included.
  //         Fewer than two points yields just lo.
  // -------------------------------------------------------------------------
  std::vector<PnlPoint> sample(double lo, double hi, int points) const;

  std::int64_t horizonDay() const { return horizon_day_; }

  double maxStrike() const;

  // Σ premium * quantity / 100: total premium in per-share terms.
  double premiumPerShare() const;

  const std::vector<domain::OptionLeg>& legs() const { return legs_; }

 private:
  std::vector<domain::OptionLeg> legs_;
  GreeksEngine pricer_;
  std::int64_t horizon_day_{0};
};

}  // namespace optrisk
