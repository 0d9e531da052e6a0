#pragma once

#include "optrisk/domain/option_leg.hpp"
#include "optrisk/domain/strategy_classification.hpp"
#include "optrisk/domain/validation_result.hpp"
#include "optrisk/pricing/pricing_config.hpp"
#include "optrisk/probability/payoff_profile.hpp"

#include <cstdint>
#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// lognormalCdf(x, s0, sigma, tau, r, q)
// -----------------------------------------------------------------------------
//
// @brief  P(S_T <= x) under the risk-neutral lognormal law
//           ln S_T ~ N(ln S0 + (r - q - σ²/2)τ, σ²τ).
//
// @details
// x <= 0 gives 0. With σ <= 0 or τ <= 0 the law collapses onto the forward
// S0 e^{(r-q)τ} (S0 itself once τ <= 0) and the CDF is a step there.
// -----------------------------------------------------------------------------
double lognormalCdf(double x, double s0, double sigma, double tau, double r,
                    double q);

// -----------------------------------------------------------------------------
// ProbabilityAnalyzer
// -----------------------------------------------------------------------------
//
// @brief  Breakevens, probability of profit at the horizon and the chance of
//         meeting early profit targets by an interim day, all under the
//         lognormal law.
//
// @details
// Breakevens:
//   Single leg    closed form K ± premium / 100 (calls add, puts subtract);
//                 a put breakeven at or below zero is dropped.
//   Otherwise     the P&L is sampled on kGridPoints prices spanning
//                 [kGridFloor, 3 * max(S0, K_max) + Σ premium * q / 100].
//                 Every change between "profitable" (P&L > 0) and not is
//                 bracketed and refined by kBisectionIterations halvings.
//                 Roots closer than kRootTolerance are merged.
//
// PoP:
//   Breakevens split (0, ∞) into intervals on which profitability is
//   constant. Each interval is tested at an interior point and the
//   lognormal mass of the profitable ones is summed. Without breakevens the
//   answer is all or nothing, decided at S0. Reported as a percentage.
//
// Early exit ("profit_50" / "profit_25"):
//   target = fraction * max profit, or fraction * |net cost| when max
//   profit is unbounded. The check day sits halfway (whole days, rounded
//   down) between the valuation day and the horizon. Every leg is marked
//   with Black-Scholes at that day, the price regions where the marked P&L
//   reaches the target are located on the grid and refined by bisection,
//   and their lognormal mass over the interim τ is the probability.
//   Deterministic; falls as S0 moves away from the target region, and the
//   25% figure is never below the 50% one. With no time left the answer is
//   all or nothing, decided at S0.
//
// Market inputs: spot and volatility of the first leg; τ from the valuation
// day to the horizon (earliest expiry).
//
// Thread-safety: Immutable after construction.
// -----------------------------------------------------------------------------
class ProbabilityAnalyzer {
 public:
  static constexpr int kGridPoints = 4000;
  static constexpr int kBisectionIterations = 60;
  static constexpr double kRootTolerance = 1e-6;
  static constexpr double kGridFloor = 0.01;

  explicit ProbabilityAnalyzer(PricingConfig config = {}) : config_(config) {}

  // -------------------------------------------------------------------------
  // analyze(legs, classification, valuation_ms)
  // -------------------------------------------------------------------------
  // @throws InputError if legs is empty.
  // -------------------------------------------------------------------------
  domain::ProbabilitySummary analyze(
      const std::vector<domain::OptionLeg>& legs,
      const domain::StrategyClassification& classification,
      std::int64_t valuation_ms) const;

  std::vector<double> findBreakevens(const PayoffProfile& profile,
                                     double spot) const;

  // Percent in [0, 100].
  double probabilityOfProfit(const PayoffProfile& profile,
                             const std::vector<double>& breakevens,
                             double spot, double sigma, double tau) const;

  // Percent in [0, 100].
  double earlyExitProbability(
      const PayoffProfile& profile,
      const domain::StrategyClassification& classification, double fraction,
      double spot, double sigma, std::int64_t valuation_day) const;

 private:
  std::vector<double> grid(const PayoffProfile& profile, double spot) const;

  PricingConfig config_;
};

}  // namespace optrisk
