#pragma once

#include "optrisk/domain/types.hpp"

namespace optrisk {

// Standard normal cumulative distribution and density.
double normCdf(double x);
double normPdf(double x);

// -----------------------------------------------------------------------------
// PricingInputs — one European option valuation request
// -----------------------------------------------------------------------------
// tau is in years; rate, dividend_yield and volatility are annual decimals.
// -----------------------------------------------------------------------------
struct PricingInputs {
  domain::OptionType type{domain::OptionType::Call};
  double spot{0.0};
  double strike{0.0};
  double tau{0.0};
  double rate{0.0};
  double dividend_yield{0.0};
  double volatility{0.0};
};

// -----------------------------------------------------------------------------
// OptionValuation — per-share value and raw-unit Greeks
// -----------------------------------------------------------------------------
// Raw units: vega per 1.00 of volatility, theta per year, rho per 1.00 of
// rate. toExposure() rescales to the desk's display units.
// -----------------------------------------------------------------------------
struct OptionValuation {
  double value{0.0};
  double delta{0.0};
  double gamma{0.0};
  double theta{0.0};
  double vega{0.0};
  double rho{0.0};
};

// -----------------------------------------------------------------------------
// BlackScholes
// -----------------------------------------------------------------------------
//
// @brief  Closed-form Black-Scholes-Merton valuation with a continuous
//         dividend yield.
//
// @details
//   d1 = (ln(S/K) + (r - q + σ²/2)τ) / (σ√τ),   d2 = d1 - σ√τ
//   call = S e^{-qτ} N(d1) - K e^{-rτ} N(d2)
//   put  = K e^{-rτ} N(-d2) - S e^{-qτ} N(-d1)
//
// Degenerate inputs are handled by branches, not errors:
//
//   τ <= 0          Expired: value is intrinsic. Call delta is 1 when S > K
//                   (0 otherwise), put delta is -1 when S < K. All other
//                   Greeks are 0.
//
//   σ <= 0, τ > 0   Deterministic forward: value is the discounted forward
//                   intrinsic max(S e^{-qτ} - K e^{-rτ}, 0) for a call (put
//                   mirrored). Delta is ±e^{-qτ} when that is positive,
//                   otherwise 0. Other Greeks are 0.
//
// Thread-safety: Stateless.
// -----------------------------------------------------------------------------
class BlackScholes {
 public:
  static OptionValuation value(const PricingInputs& in);

  // -------------------------------------------------------------------------
  // toExposure(raw)
  // -------------------------------------------------------------------------
  // @brief  Per-share Greeks in display units: vega per 1% IV (÷100), theta
  //         per calendar day (÷365), rho per 1% rate (÷100). Value, delta
  //         and gamma are unchanged.
  // -------------------------------------------------------------------------
  static OptionValuation toExposure(const OptionValuation& raw);
};

}  // namespace optrisk
