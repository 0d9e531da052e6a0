#pragma once

#include "optrisk/domain/types.hpp"

#include <cstdint>
#include <string>

namespace optrisk {
namespace domain {

// -----------------------------------------------------------------------------
// OptionLeg — one line of a (candidate or existing) options position
// -----------------------------------------------------------------------------
//
// @brief  A validated option contract description together with the market
//         snapshot needed to price it.
//
// @details
// Units:
//   strike         dollars per share
//   quantity       contracts (each contract = 100 shares)
//   premium        dollars per contract (already times 100); the dollar
//                  cost of the leg is premium * quantity
//   volatility     annualised implied volatility as a decimal (0.25 = 25%)
//   current_price  spot price of the underlying
//
// expiry keeps the original "YYYY-MM-DD" text for display; expiry_day is
// the same date as days since 1970-01-01 and is what every computation uses.
//
// Thread model:
//   Value type, never mutated after create().
// -----------------------------------------------------------------------------
struct OptionLeg {
  std::string symbol;
  OptionType type{OptionType::Call};
  Side action{Side::Buy};
  double strike{0.0};
  std::string expiry;
  std::int64_t expiry_day{0};
  double quantity{0.0};
  double premium{0.0};
  double volatility{0.0};
  double current_price{0.0};

  // -------------------------------------------------------------------------
  // create(...)
  // -------------------------------------------------------------------------
  // @brief  Validating factory. Parses the expiry date.
  //
  // @throws InputError on empty symbol, strike <= 0, quantity <= 0,
  //         premium < 0, volatility < 0, current_price <= 0, or an expiry
  //         that is not a calendar date.
  // -------------------------------------------------------------------------
  static OptionLeg create(std::string symbol, OptionType type, Side action,
                          double strike, std::string expiry, double quantity,
                          double premium, double volatility,
                          double current_price);

  bool isLong() const { return action == Side::Buy; }

  // Signed premium cash flow in dollars: positive when paid.
  double netCost() const { return signOf(action) * premium * quantity; }

  // Per-share intrinsic value at underlying price s.
  double intrinsic(double s) const;

  // True when the strike is in the money against current_price.
  bool inTheMoney() const;
};

}  // namespace domain
}  // namespace optrisk
