#include "optrisk/pricing/black_scholes.hpp"

#include <algorithm>
#include <cmath>

namespace optrisk {

namespace {

constexpr double kInvSqrt2 = 0.70710678118654752440;
constexpr double kInvSqrt2Pi = 0.39894228040143267794;

}  // namespace

double normCdf(double x) { return 0.5 * std::erfc(-x * kInvSqrt2); }

double normPdf(double x) { return kInvSqrt2Pi * std::exp(-0.5 * x * x); }

// -----------------------------------------------------------------------------
// value(): degenerate branches first, then the closed form
// -----------------------------------------------------------------------------
OptionValuation BlackScholes::value(const PricingInputs& in) {
  const bool is_call = in.type == domain::OptionType::Call;
  const double s = in.spot;
  const double k = in.strike;
  OptionValuation out;

  // ---  Expired ------------------------------------------------------------
  if (in.tau <= 0.0) {
    if (is_call) {
      out.value = std::max(s - k, 0.0);
      out.delta = s > k ? 1.0 : 0.0;
    } else {
      out.value = std::max(k - s, 0.0);
      out.delta = s < k ? -1.0 : 0.0;
    }
    return out;
  }

  const double tau = in.tau;
  const double r = in.rate;
  const double q = in.dividend_yield;
  const double div_discount = std::exp(-q * tau);
  const double discount = std::exp(-r * tau);

  // ---  Zero volatility: deterministic forward -----------------------------
  if (in.volatility <= 0.0) {
    const double fwd_intrinsic = is_call ? s * div_discount - k * discount
                                         : k * discount - s * div_discount;
    if (fwd_intrinsic > 0.0) {
      out.value = fwd_intrinsic;
      out.delta = is_call ? div_discount : -div_discount;
    }
    return out;
  }

  const double sigma = in.volatility;
  const double sqrt_tau = std::sqrt(tau);
  const double d1 =
      (std::log(s / k) + (r - q + 0.5 * sigma * sigma) * tau) /
      (sigma * sqrt_tau);
  const double d2 = d1 - sigma * sqrt_tau;
  const double pdf_d1 = normPdf(d1);

  out.gamma = div_discount * pdf_d1 / (s * sigma * sqrt_tau);
  out.vega = s * div_discount * pdf_d1 * sqrt_tau;

  const double decay = -s * div_discount * pdf_d1 * sigma / (2.0 * sqrt_tau);

  if (is_call) {
    out.value = s * div_discount * normCdf(d1) - k * discount * normCdf(d2);
    out.delta = div_discount * normCdf(d1);
    out.theta = decay - r * k * discount * normCdf(d2) +
                q * s * div_discount * normCdf(d1);
    out.rho = k * tau * discount * normCdf(d2);
  } else {
    out.value = k * discount * normCdf(-d2) - s * div_discount * normCdf(-d1);
    out.delta = -div_discount * normCdf(-d1);
    out.theta = decay + r * k * discount * normCdf(-d2) -
                q * s * div_discount * normCdf(-d1);
    out.rho = -k * tau * discount * normCdf(-d2);
  }

  return out;
}

OptionValuation BlackScholes::toExposure(const OptionValuation& raw) {
  OptionValuation out = raw;
  out.vega = raw.vega / 100.0;
  out.theta = raw.theta / 365.0;
  out.rho = raw.rho / 100.0;
  return out;
}

}  // namespace optrisk
