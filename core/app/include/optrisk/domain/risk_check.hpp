#pragma once

#include "optrisk/domain/types.hpp"

#include <optional>
#include <string>

namespace optrisk {
namespace domain {

// -----------------------------------------------------------------------------
// RiskCheck — outcome of a single validation rule
// -----------------------------------------------------------------------------
//
// @details
// current_value and limit_value are present for checks that compare a
// measured quantity against a threshold (Greeks caps, capital, PoP, IV
// rank) and absent for purely descriptive ones.
// -----------------------------------------------------------------------------
struct RiskCheck {
  std::string name;
  RiskLevel level{RiskLevel::Pass};
  std::string message;
  std::optional<double> current_value;
  std::optional<double> limit_value;
};

}  // namespace domain
}  // namespace optrisk
