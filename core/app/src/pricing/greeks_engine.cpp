#include "optrisk/pricing/greeks_engine.hpp"
#include "optrisk/time/time_utils.hpp"

namespace optrisk {

PricingInputs GreeksEngine::inputsFor(const domain::OptionLeg& leg,
                                      double spot,
                                      std::int64_t valuation_day) const {
  PricingInputs in;
  in.type = leg.type;
  in.spot = spot;
  in.strike = leg.strike;
  in.tau = year_fraction(leg.expiry_day - valuation_day);
  in.rate = config_.risk_free_rate;
  in.dividend_yield = config_.dividend_yield;
  in.volatility = leg.volatility;
  return in;
}

OptionValuation GreeksEngine::valueLeg(const domain::OptionLeg& leg,
                                       std::int64_t valuation_ms) const {
  return BlackScholes::value(
      inputsFor(leg, leg.current_price, ms_to_epoch_day(valuation_ms)));
}

double GreeksEngine::valueAt(const domain::OptionLeg& leg, double spot,
                             std::int64_t valuation_day) const {
  return BlackScholes::value(inputsFor(leg, spot, valuation_day)).value;
}

// -----------------------------------------------------------------------------
// legGreeks(): exposure units × direction × contracts × multiplier
// -----------------------------------------------------------------------------
domain::GreeksVector GreeksEngine::legGreeks(const domain::OptionLeg& leg,
                                             std::int64_t valuation_ms) const {
  const OptionValuation exposure =
      BlackScholes::toExposure(valueLeg(leg, valuation_ms));

  domain::GreeksVector g;
  g.delta = exposure.delta;
  g.gamma = exposure.gamma;
  g.theta = exposure.theta;
  g.vega = exposure.vega;
  g.rho = exposure.rho;

  return g * (domain::signOf(leg.action) * leg.quantity * kContractMultiplier);
}

domain::GreeksVector GreeksEngine::aggregate(
    const std::vector<domain::OptionLeg>& legs,
    std::int64_t valuation_ms) const {
  domain::GreeksVector total;
  for (const auto& leg : legs) {
    total += legGreeks(leg, valuation_ms);
  }
  return total;
}

}  // namespace optrisk
