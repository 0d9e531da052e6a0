#include "optrisk/domain/option_leg.hpp"
#include "optrisk/domain/errors.hpp"
#include "optrisk/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace optrisk {
namespace domain {

namespace {

bool finite(double v) { return std::isfinite(v); }

}  // namespace

// -----------------------------------------------------------------------------
// create(): validate every numeric field, then parse the expiry
// -----------------------------------------------------------------------------
OptionLeg OptionLeg::create(std::string symbol, OptionType type, Side action,
                            double strike, std::string expiry,
                            double quantity, double premium,
                            double volatility, double current_price) {
  if (symbol.empty()) {
    throw InputError("option leg symbol must not be empty");
  }
  if (!finite(strike) || strike <= 0.0) {
    throw InputError("option leg strike must be positive for " + symbol);
  }
  if (!finite(quantity) || quantity <= 0.0) {
    throw InputError("option leg quantity must be positive for " + symbol);
  }
  if (!finite(premium) || premium < 0.0) {
    throw InputError("option leg premium must be non-negative for " + symbol);
  }
  if (!finite(volatility) || volatility < 0.0) {
    throw InputError("option leg volatility must be non-negative for " +
                     symbol);
  }
  if (!finite(current_price) || current_price <= 0.0) {
    throw InputError("option leg current_price must be positive for " +
                     symbol);
  }

  OptionLeg leg;
  leg.expiry_day = parse_iso_date(expiry);
  leg.symbol = std::move(symbol);
  leg.type = type;
  leg.action = action;
  leg.strike = strike;
  leg.expiry = std::move(expiry);
  leg.quantity = quantity;
  leg.premium = premium;
  leg.volatility = volatility;
  leg.current_price = current_price;
  return leg;
}

double OptionLeg::intrinsic(double s) const {
  return type == OptionType::Call ? std::max(s - strike, 0.0)
                                  : std::max(strike - s, 0.0);
}

bool OptionLeg::inTheMoney() const {
  return type == OptionType::Call ? current_price > strike
                                  : current_price < strike;
}

}  // namespace domain
}  // namespace optrisk
