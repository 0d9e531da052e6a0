#include "optrisk/probability/payoff_profile.hpp"
#include "optrisk/domain/errors.hpp"

#include <algorithm>
#include <utility>

namespace optrisk {

PayoffProfile::PayoffProfile(std::vector<domain::OptionLeg> legs,
                             GreeksEngine pricer)
    : legs_(std::move(legs)), pricer_(pricer) {
  if (legs_.empty()) {
    throw InputError("payoff profile needs at least one leg");
  }
  horizon_day_ = legs_.front().expiry_day;
  for (const auto& leg : legs_) {
    horizon_day_ = std::min(horizon_day_, leg.expiry_day);
  }
}

// -----------------------------------------------------------------------------
// pnlAt(): intrinsic for legs expiring at the horizon, BS for the rest
// -----------------------------------------------------------------------------
double PayoffProfile::pnlAt(double price) const {
  double pnl = 0.0;
  for (const auto& leg : legs_) {
    const double per_share = leg.expiry_day <= horizon_day_
                                 ? leg.intrinsic(price)
                                 : pricer_.valueAt(leg, price, horizon_day_);
    pnl += domain::signOf(leg.action) * leg.quantity *
           (GreeksEngine::kContractMultiplier * per_share - leg.premium);
  }
  return pnl;
}

double PayoffProfile::markedPnlAt(double price,
                                  std::int64_t valuation_day) const {
  double pnl = 0.0;
  for (const auto& leg : legs_) {
    pnl += domain::signOf(leg.action) * leg.quantity *
           (GreeksEngine::kContractMultiplier *
                pricer_.valueAt(leg, price, valuation_day) -
            leg.premium);
  }
  return pnl;
}

std::vector<PnlPoint> PayoffProfile::sample(double lo, double hi,
                                            int points) const {
  std::vector<PnlPoint> curve;
  if (points < 2) {
    curve.push_back({lo, pnlAt(lo)});
    return curve;
  }
  curve.reserve(static_cast<std::size_t>(points));
  const double step = (hi - lo) / static_cast<double>(points - 1);
  for (int i = 0; i < points; ++i) {
    const double x = lo + step * static_cast<double>(i);
    curve.push_back({x, pnlAt(x)});
  }
  return curve;
}

double PayoffProfile::maxStrike() const {
  double k = 0.0;
  for (const auto& leg : legs_) {
    k = std::max(k, leg.strike);
  }
  return k;
}

double PayoffProfile::premiumPerShare() const {
  double total = 0.0;
  for (const auto& leg : legs_) {
    total += leg.premium * leg.quantity;
  }
  return total / GreeksEngine::kContractMultiplier;
}

}  // namespace optrisk
