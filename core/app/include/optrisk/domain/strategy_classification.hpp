#pragma once

#include "optrisk/domain/types.hpp"

#include <cmath>
#include <limits>

namespace optrisk {
namespace domain {

// Sentinel for a loss or profit with no finite bound.
constexpr double kUnbounded = std::numeric_limits<double>::infinity();

inline bool isUnbounded(double v) { return std::isinf(v); }

// -----------------------------------------------------------------------------
// StrategyClassification
// -----------------------------------------------------------------------------
//
// @brief  Result of matching a set of legs against the strategy catalogue.
//
// @details
// All amounts are dollars for the whole position (contract multiplier 100
// applied). net_cost is positive for a debit and negative for a credit.
// max_loss and max_profit are non-negative magnitudes, or kUnbounded.
// -----------------------------------------------------------------------------
struct StrategyClassification {
  StrategyType type{StrategyType::Custom};
  int leg_count{0};
  double net_cost{0.0};
  double max_loss{kUnbounded};
  double max_profit{kUnbounded};

  bool isCredit() const { return net_cost < 0.0; }
};

}  // namespace domain
}  // namespace optrisk
