#include "optrisk/domain/types.hpp"
#include "optrisk/domain/errors.hpp"

#include <algorithm>
#include <cctype>

namespace optrisk {
namespace domain {

namespace {

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return text;
}

}  // namespace

// -----------------------------------------------------------------------------
// toString overloads
// -----------------------------------------------------------------------------
const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

const char* toString(OptionType type) {
  switch (type) {
    case OptionType::Call: return "CALL";
    case OptionType::Put:  return "PUT";
  }
  return "UNKNOWN";
}

const char* toString(RiskLevel level) {
  switch (level) {
    case RiskLevel::Blocker: return "BLOCKER";
    case RiskLevel::Warning: return "WARNING";
    case RiskLevel::Info:    return "INFO";
    case RiskLevel::Pass:    return "PASS";
  }
  return "UNKNOWN";
}

const char* toString(RiskProfile profile) {
  switch (profile) {
    case RiskProfile::Conservative: return "CONSERVATIVE";
    case RiskProfile::Moderate:     return "MODERATE";
    case RiskProfile::Aggressive:   return "AGGRESSIVE";
  }
  return "UNKNOWN";
}

const char* toString(StrategyType type) {
  using S = StrategyType;
  switch (type) {
    case S::LongCall:         return "long_call";
    case S::LongPut:          return "long_put";
    case S::ShortCall:        return "short_call";
    case S::ShortPut:         return "short_put";
    case S::CallDebitSpread:  return "call_debit_spread";
    case S::CallCreditSpread: return "call_credit_spread";
    case S::PutDebitSpread:   return "put_debit_spread";
    case S::PutCreditSpread:  return "put_credit_spread";
    case S::LongStraddle:     return "long_straddle";
    case S::ShortStraddle:    return "short_straddle";
    case S::LongStrangle:     return "long_strangle";
    case S::ShortStrangle:    return "short_strangle";
    case S::IronCondor:       return "iron_condor";
    case S::IronButterfly:    return "iron_butterfly";
    case S::CalendarSpread:   return "calendar_spread";
    case S::DiagonalSpread:   return "diagonal_spread";
    case S::RatioSpread:      return "ratio_spread";
    case S::Butterfly:        return "butterfly";
    case S::Custom:           return "custom";
  }
  return "custom";
}

// -----------------------------------------------------------------------------
// parse helpers: case-insensitive, throw InputError on unknown names
// -----------------------------------------------------------------------------
Side parseSide(const std::string& text) {
  const std::string u = upper(text);
  if (u == "BUY") return Side::Buy;
  if (u == "SELL") return Side::Sell;
  throw InputError("side must be BUY or SELL, got '" + text + "'");
}

OptionType parseOptionType(const std::string& text) {
  const std::string u = upper(text);
  if (u == "CALL") return OptionType::Call;
  if (u == "PUT") return OptionType::Put;
  throw InputError("option_type must be CALL or PUT, got '" + text + "'");
}

RiskLevel parseRiskLevel(const std::string& text) {
  const std::string u = upper(text);
  if (u == "BLOCKER") return RiskLevel::Blocker;
  if (u == "WARNING") return RiskLevel::Warning;
  if (u == "INFO") return RiskLevel::Info;
  if (u == "PASS") return RiskLevel::Pass;
  throw InputError("unknown risk level '" + text + "'");
}

RiskProfile parseRiskProfile(const std::string& text) {
  const std::string u = upper(text);
  if (u == "CONSERVATIVE") return RiskProfile::Conservative;
  if (u == "MODERATE") return RiskProfile::Moderate;
  if (u == "AGGRESSIVE") return RiskProfile::Aggressive;
  throw InputError(
      "risk_profile must be CONSERVATIVE, MODERATE or AGGRESSIVE, got '" +
      text + "'");
}

}  // namespace domain
}  // namespace optrisk
