#pragma once

#include "optrisk/domain/option_leg.hpp"
#include "optrisk/domain/risk_limits.hpp"
#include "optrisk/domain/validation_result.hpp"
#include "optrisk/pricing/greeks_engine.hpp"
#include "optrisk/pricing/pricing_config.hpp"
#include "optrisk/probability/probability_analyzer.hpp"
#include "optrisk/strategy/strategy_classifier.hpp"
#include "optrisk/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// ValidationRequest — immutable snapshot handed to RiskValidator
// -----------------------------------------------------------------------------
//
// @details
// existing_legs describe the open book (the caller derives them from its
// positions). iv_rank, when given, wins over iv_history; with neither the
// IV rank check reports INFO. valuation_ms pins the valuation instant;
// without it the validator asks its time provider.
// -----------------------------------------------------------------------------
struct ValidationRequest {
  std::vector<domain::OptionLeg> new_legs;
  std::vector<domain::OptionLeg> existing_legs;
  double portfolio_cash{0.0};
  domain::RiskProfile risk_profile{domain::RiskProfile::Moderate};
  std::optional<double> iv_rank;
  std::vector<double> iv_history;
  std::optional<std::int64_t> valuation_ms;
};

// -----------------------------------------------------------------------------
// RiskValidator — pre-trade gate for multi-leg option trades
// -----------------------------------------------------------------------------
//
// @brief  Classifies the candidate, prices both books, estimates the
//         probability of profit and runs the fixed battery of checks.
//
// @details
// Check order (display only; every check is independent):
//
//   portfolio_delta / _gamma / _vega / _theta
//                          |combined| > cap → BLOCKER. Delta also warns
//                          above delta_warning_fraction of its cap. When
//                          nothing fires a single greeks_limits PASS is
//                          emitted instead.
//   capital_requirement    credit → PASS; debit > cash → BLOCKER;
//                          debit > capital_warning_fraction * cash → WARNING.
//   probability_of_profit  PoP below the profile minimum → WARNING.
//   iv_rank                credit strategies only; rank below the minimum
//                          → WARNING, unknown → INFO.
//   symbol_concentration   more than max_legs_per_symbol existing legs on a
//                          candidate symbol → WARNING.
//   early_assignment_risk  a short candidate leg in the money with fewer
//                          than early_assignment_days to expiry → WARNING.
//   expiration_concentration
//                          more than max_legs_per_expiry legs (both books)
//                          on a candidate expiry → WARNING.
//   strike_concentration   more than max_legs_per_strike legs (both books)
//                          on a candidate (symbol, strike) → WARNING.
//   debit_credit           INFO.
//   max_loss_profit        INFO.
//
// passed is true exactly when no BLOCKER was produced. Rule breaches never
// throw; only malformed requests do (InputError).
//
// Thread model:
//   No mutable state. The time provider must outlive the validator.
// -----------------------------------------------------------------------------
class RiskValidator {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  limits   Thresholds for every check.
  // @param  pricing  Market parameters for pricing and probabilities.
  // @param  clock    Valuation clock used when a request carries no
  //                  valuation_ms.
  // -------------------------------------------------------------------------
  RiskValidator(const domain::RiskLimits& limits, const PricingConfig& pricing,
                const ITimeProvider& clock);

  // -------------------------------------------------------------------------
  // validate(request)
  // -------------------------------------------------------------------------
  // @throws InputError for an empty or oversized candidate or a non-finite
  //         cash balance.
  // -------------------------------------------------------------------------
  domain::ValidationResult validate(const ValidationRequest& request) const;

  // -------------------------------------------------------------------------
  // ivRank(current_iv, history)
  // -------------------------------------------------------------------------
  // @brief  (iv - min) / (max - min) * 100, clamped to [0, 100].
  //
  // @return nullopt when the history is empty or flat.
  // -------------------------------------------------------------------------
  static std::optional<double> ivRank(double current_iv,
                                      const std::vector<double>& history);

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  void checkGreeks(const domain::GreeksImpact& impact,
                   std::vector<domain::RiskCheck>& out) const;
  domain::RiskCheck checkCapital(double cost, double cash) const;
  domain::RiskCheck checkProbability(double pop,
                                     domain::RiskProfile profile) const;
  domain::RiskCheck checkIvRank(std::optional<double> rank) const;
  domain::RiskCheck checkSymbolConcentration(
      const ValidationRequest& request) const;
  domain::RiskCheck checkEarlyAssignment(const ValidationRequest& request,
                                         std::int64_t valuation_ms) const;
  domain::RiskCheck checkExpirationConcentration(
      const ValidationRequest& request) const;
  domain::RiskCheck checkStrikeConcentration(
      const ValidationRequest& request) const;

  domain::RiskLimits limits_;
  GreeksEngine greeks_;
  ProbabilityAnalyzer probability_;
  StrategyClassifier classifier_;
  const ITimeProvider& clock_;
};

}  // namespace optrisk
