#pragma once

#include "optrisk/domain/greeks.hpp"
#include "optrisk/domain/risk_check.hpp"
#include "optrisk/domain/strategy_classification.hpp"

#include <vector>

namespace optrisk {
namespace domain {

// Greeks of the book before, of the candidate alone, and after the trade.
struct GreeksImpact {
  GreeksVector current;
  GreeksVector new_trade;
  GreeksVector combined;
};

// -----------------------------------------------------------------------------
// ProbabilitySummary
// -----------------------------------------------------------------------------
// Probabilities are percentages in [0, 100]. breakevens is ascending.
// -----------------------------------------------------------------------------
struct ProbabilitySummary {
  double pop_expiration{0.0};
  std::vector<double> breakevens;
  double profit_50_probability{0.0};
  double profit_25_probability{0.0};
  double current_price{0.0};
};

// -----------------------------------------------------------------------------
// ValidationResult — verdict of RiskValidator::validate()
// -----------------------------------------------------------------------------
//
// @details
// passed is true exactly when no check has level Blocker. checks keeps the
// order in which the validator ran them; clients display it as is.
// -----------------------------------------------------------------------------
struct ValidationResult {
  bool passed{true};
  std::vector<RiskCheck> checks;
  StrategyClassification classification;
  GreeksImpact greeks;
  ProbabilitySummary probability;
};

}  // namespace domain
}  // namespace optrisk
