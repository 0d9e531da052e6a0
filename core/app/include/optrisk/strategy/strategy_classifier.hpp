#pragma once

#include "optrisk/domain/option_leg.hpp"
#include "optrisk/domain/strategy_classification.hpp"

#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// StrategyClassifier — structural matching of a candidate trade
// -----------------------------------------------------------------------------
//
// @brief  Maps 1 to 4 option legs onto the StrategyType catalogue and
//         computes the shape's net cost and loss/profit bounds.
//
// @details
// Legs that are identical apart from quantity and premium (same symbol,
// type, action, strike and expiry) are merged first, so a butterfly body
// sent as two one-lot legs still matches. Matching then looks only at
// structure: leg count, types, actions, quantities, strike ordering and
// expiries. Premiums only decide debit versus credit.
//
//   1 leg    Long/Short Call/Put
//   2 legs   same type, same expiry, opposite actions
//              equal size   → vertical (Call/Put, Debit/Credit)
//              unequal size → RatioSpread
//            same type, different expiries, opposite actions, equal size
//              same strike  → CalendarSpread, else DiagonalSpread
//            call + put, same expiry, same action, equal size
//              same strike  → Straddle, else Strangle (Long if bought)
//   3 legs   same type and expiry, equidistant strikes, wings q one way,
//            body 2q the other way → Butterfly
//   4 legs   one long and one short call, one long and one short put, equal
//            size, same expiry, put strikes at or below call strikes, and
//            the short pair (or the long pair) inside the wings
//              inner strikes equal → IronButterfly, else IronCondor
//
// Anything else, including legs on more than one symbol, is Custom with
// both bounds unbounded.
//
// All amounts are dollars. Premiums are per contract, strikes per share,
// so a strike width w on q contracts is worth w * 100 * q.
//
// Thread-safety: Stateless.
// -----------------------------------------------------------------------------
class StrategyClassifier {
 public:
  static constexpr std::size_t kMaxLegs = 4;

  // -------------------------------------------------------------------------
  // classify(legs)
  // -------------------------------------------------------------------------
  // @throws InputError if legs is empty or holds more than kMaxLegs legs.
  // -------------------------------------------------------------------------
  domain::StrategyClassification classify(
      const std::vector<domain::OptionLeg>& legs) const;

  // Merges legs that differ only in quantity and premium. Quantities add;
  // the merged premium is quantity-weighted so net cost is unchanged.
  static std::vector<domain::OptionLeg> mergeLegs(
      const std::vector<domain::OptionLeg>& legs);

 private:
  static domain::StrategyType matchShape(
      const std::vector<domain::OptionLeg>& legs, double net_cost);

  static void applyBounds(domain::StrategyClassification& out,
                          const std::vector<domain::OptionLeg>& legs);
};

}  // namespace optrisk
