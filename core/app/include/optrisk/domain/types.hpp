#pragma once

#include <string>

namespace optrisk {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Direction of a transaction or of an option leg. Buy opens/extends a long
// lot (or pays premium); Sell consumes lots (or collects premium).
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// OptionType
// -----------------------------------------------------------------------------
enum class OptionType {
  Call,
  Put,
};

// -----------------------------------------------------------------------------
// RiskLevel — severity attached to every RiskCheck
// -----------------------------------------------------------------------------
//
// @details
// Only Blocker affects the overall pass/fail verdict. Warning and Info are
// surfaced for human acknowledgment; Pass records that a check ran clean.
// -----------------------------------------------------------------------------
enum class RiskLevel {
  Blocker,
  Warning,
  Info,
  Pass,
};

// -----------------------------------------------------------------------------
// RiskProfile — selects the minimum acceptable probability of profit
// -----------------------------------------------------------------------------
enum class RiskProfile {
  Conservative,
  Moderate,
  Aggressive,
};

// -----------------------------------------------------------------------------
// StrategyType — the closed catalogue of recognised multi-leg shapes
// -----------------------------------------------------------------------------
//
// @details
// Anything the classifier cannot match structurally falls back to Custom.
// Vertical spreads are split by debit/credit so each member has a single
// closed form for its max loss and max profit.
// -----------------------------------------------------------------------------
enum class StrategyType {
  LongCall,
  LongPut,
  ShortCall,
  ShortPut,
  CallDebitSpread,
  CallCreditSpread,
  PutDebitSpread,
  PutCreditSpread,
  LongStraddle,
  ShortStraddle,
  LongStrangle,
  ShortStrangle,
  IronCondor,
  IronButterfly,
  CalendarSpread,
  DiagonalSpread,
  RatioSpread,
  Butterfly,
  Custom,
};

// -----------------------------------------------------------------------------
// String conversions
// -----------------------------------------------------------------------------
//
// @brief  Wire names used by the JSON codec ("BUY", "CALL", "BLOCKER",
//         "iron_condor", ...).
//
// @details
// parse*() accepts any letter case and throws InputError on an unknown
// name. toString() never fails: every enumerator has a name.
// -----------------------------------------------------------------------------
const char* toString(Side side);
const char* toString(OptionType type);
const char* toString(RiskLevel level);
const char* toString(RiskProfile profile);
const char* toString(StrategyType type);

Side parseSide(const std::string& text);
OptionType parseOptionType(const std::string& text);
RiskLevel parseRiskLevel(const std::string& text);
RiskProfile parseRiskProfile(const std::string& text);

// +1.0 for Buy, -1.0 for Sell.
inline double signOf(Side side) { return side == Side::Buy ? 1.0 : -1.0; }

}  // namespace domain
}  // namespace optrisk
