#include "optrisk/strategy/strategy_classifier.hpp"
#include "optrisk/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace optrisk {

using domain::OptionLeg;
using domain::OptionType;
using domain::Side;
using domain::StrategyType;
using domain::kUnbounded;

namespace {

constexpr double kMultiplier = 100.0;
constexpr double kEps = 1e-9;

bool same(double a, double b) { return std::fabs(a - b) < kEps; }

// Net cost decides debit versus credit. A zero-cost shape falls back to its
// direction: long_structure is true when the shape pays off like a debit one.
bool debitForm(double net_cost, bool long_structure) {
  if (net_cost > kEps) {
    return true;
  }
  if (net_cost < -kEps) {
    return false;
  }
  return long_structure;
}

bool sameKey(const OptionLeg& a, const OptionLeg& b) {
  return a.symbol == b.symbol && a.type == b.type && a.action == b.action &&
         same(a.strike, b.strike) && a.expiry_day == b.expiry_day;
}

const OptionLeg* find(const std::vector<OptionLeg>& legs, OptionType type,
                      Side action) {
  for (const auto& leg : legs) {
    if (leg.type == type && leg.action == action) {
      return &leg;
    }
  }
  return nullptr;
}

// -----------------------------------------------------------------------------
// Expiration P&L of same-expiry legs, evaluated at the kinks and the tails.
// Returns {max_loss, max_profit}, each kUnbounded when a tail diverges.
// -----------------------------------------------------------------------------
std::pair<double, double> piecewiseExtremes(const std::vector<OptionLeg>& legs) {
  auto pnl = [&legs](double s) {
    double total = 0.0;
    for (const auto& leg : legs) {
      total += domain::signOf(leg.action) * leg.quantity *
               (kMultiplier * leg.intrinsic(s) - leg.premium);
    }
    return total;
  };

  double lo = pnl(0.0);
  double hi = lo;
  for (const auto& leg : legs) {
    const double v = pnl(leg.strike);
    lo = std::min(lo, v);
    hi = std::max(hi, v);
  }

  // Slope beyond the highest strike comes from the calls only.
  double tail_slope = 0.0;
  for (const auto& leg : legs) {
    if (leg.type == OptionType::Call) {
      tail_slope += domain::signOf(leg.action) * leg.quantity;
    }
  }

  double max_loss = std::max(0.0, -lo);
  double max_profit = std::max(0.0, hi);
  if (tail_slope > kEps) {
    max_profit = kUnbounded;
  } else if (tail_slope < -kEps) {
    max_loss = kUnbounded;
  }
  return {max_loss, max_profit};
}

}  // namespace

// -----------------------------------------------------------------------------
// mergeLegs(): collapse identical contracts
// -----------------------------------------------------------------------------
std::vector<OptionLeg> StrategyClassifier::mergeLegs(
    const std::vector<OptionLeg>& legs) {
  std::vector<OptionLeg> merged;
  for (const auto& leg : legs) {
    auto it = std::find_if(merged.begin(), merged.end(),
                           [&leg](const OptionLeg& m) { return sameKey(m, leg); });
    if (it == merged.end()) {
      merged.push_back(leg);
      continue;
    }
    const double qty = it->quantity + leg.quantity;
    it->premium = (it->premium * it->quantity + leg.premium * leg.quantity) / qty;
    it->quantity = qty;
  }
  return merged;
}

// -----------------------------------------------------------------------------
// classify()
// -----------------------------------------------------------------------------
domain::StrategyClassification StrategyClassifier::classify(
    const std::vector<OptionLeg>& legs) const {
  if (legs.empty()) {
    throw InputError("strategy needs at least one leg");
  }
  if (legs.size() > kMaxLegs) {
    throw InputError("strategy supports at most " + std::to_string(kMaxLegs) +
                     " legs, got " + std::to_string(legs.size()));
  }

  domain::StrategyClassification out;
  out.leg_count = static_cast<int>(legs.size());
  for (const auto& leg : legs) {
    out.net_cost += leg.netCost();
  }

  const std::vector<OptionLeg> merged = mergeLegs(legs);
  out.type = matchShape(merged, out.net_cost);
  applyBounds(out, merged);
  return out;
}

// -----------------------------------------------------------------------------
// matchShape(): structural catalogue lookup
// -----------------------------------------------------------------------------
StrategyType StrategyClassifier::matchShape(const std::vector<OptionLeg>& legs,
                                            double net_cost) {
  for (const auto& leg : legs) {
    if (leg.symbol != legs.front().symbol) {
      return StrategyType::Custom;
    }
  }

  // ---  1 leg ----------------------------------------------------------------
  if (legs.size() == 1) {
    const auto& leg = legs.front();
    if (leg.type == OptionType::Call) {
      return leg.isLong() ? StrategyType::LongCall : StrategyType::ShortCall;
    }
    return leg.isLong() ? StrategyType::LongPut : StrategyType::ShortPut;
  }

  // ---  2 legs ---------------------------------------------------------------
  if (legs.size() == 2) {
    const auto& a = legs[0];
    const auto& b = legs[1];
    const bool same_expiry = a.expiry_day == b.expiry_day;
    const bool equal_size = same(a.quantity, b.quantity);

    if (a.type == b.type && a.action != b.action) {
      if (same_expiry && !same(a.strike, b.strike)) {
        if (!equal_size) {
          return StrategyType::RatioSpread;
        }
        const OptionLeg& bought = a.isLong() ? a : b;
        const OptionLeg& sold = a.isLong() ? b : a;
        // Bull call and bear put spreads are the debit verticals.
        const bool long_structure = a.type == OptionType::Call
                                        ? bought.strike < sold.strike
                                        : bought.strike > sold.strike;
        const bool debit = debitForm(net_cost, long_structure);
        if (a.type == OptionType::Call) {
          return debit ? StrategyType::CallDebitSpread
                       : StrategyType::CallCreditSpread;
        }
        return debit ? StrategyType::PutDebitSpread
                     : StrategyType::PutCreditSpread;
      }
      if (!same_expiry && equal_size) {
        return same(a.strike, b.strike) ? StrategyType::CalendarSpread
                                        : StrategyType::DiagonalSpread;
      }
      return StrategyType::Custom;
    }

    if (a.type != b.type && a.action == b.action && same_expiry && equal_size) {
      if (same(a.strike, b.strike)) {
        return a.isLong() ? StrategyType::LongStraddle
                          : StrategyType::ShortStraddle;
      }
      return a.isLong() ? StrategyType::LongStrangle
                        : StrategyType::ShortStrangle;
    }
    return StrategyType::Custom;
  }

  for (const auto& leg : legs) {
    if (leg.expiry_day != legs.front().expiry_day) {
      return StrategyType::Custom;
    }
  }

  // ---  3 legs: butterfly ----------------------------------------------------
  if (legs.size() == 3) {
    std::vector<OptionLeg> sorted(legs);
    std::sort(sorted.begin(), sorted.end(),
              [](const OptionLeg& x, const OptionLeg& y) {
                return x.strike < y.strike;
              });
    const auto& lo = sorted[0];
    const auto& body = sorted[1];
    const auto& hi = sorted[2];

    const bool one_type = lo.type == body.type && body.type == hi.type;
    const bool distinct = lo.strike + kEps < body.strike &&
                          body.strike + kEps < hi.strike;
    const bool equidistant =
        same(body.strike - lo.strike, hi.strike - body.strike);
    const bool wings_match =
        lo.action == hi.action && same(lo.quantity, hi.quantity);
    const bool body_opposite =
        body.action != lo.action && same(body.quantity, 2.0 * lo.quantity);

    if (one_type && distinct && equidistant && wings_match && body_opposite) {
      return StrategyType::Butterfly;
    }
    return StrategyType::Custom;
  }

  // ---  4 legs: iron condor / iron butterfly ---------------------------------
  const OptionLeg* long_call = find(legs, OptionType::Call, Side::Buy);
  const OptionLeg* short_call = find(legs, OptionType::Call, Side::Sell);
  const OptionLeg* long_put = find(legs, OptionType::Put, Side::Buy);
  const OptionLeg* short_put = find(legs, OptionType::Put, Side::Sell);
  if (!long_call || !short_call || !long_put || !short_put) {
    return StrategyType::Custom;
  }

  const double q = long_call->quantity;
  for (const auto& leg : legs) {
    if (!same(leg.quantity, q)) {
      return StrategyType::Custom;
    }
  }

  const double put_max = std::max(long_put->strike, short_put->strike);
  const double call_min = std::min(long_call->strike, short_call->strike);
  if (put_max > call_min + kEps) {
    return StrategyType::Custom;
  }

  const bool shorts_inside = short_put->strike > long_put->strike + kEps &&
                             short_call->strike + kEps < long_call->strike;
  const bool longs_inside = long_put->strike > short_put->strike + kEps &&
                            long_call->strike + kEps < short_call->strike;
  if (!shorts_inside && !longs_inside) {
    return StrategyType::Custom;
  }

  return same(put_max, call_min) ? StrategyType::IronButterfly
                                 : StrategyType::IronCondor;
}

// -----------------------------------------------------------------------------
// applyBounds(): closed-form max loss / max profit per shape
// -----------------------------------------------------------------------------
void StrategyClassifier::applyBounds(domain::StrategyClassification& out,
                                     const std::vector<OptionLeg>& legs) {
  const double debit = std::max(out.net_cost, 0.0);
  const double credit = std::max(-out.net_cost, 0.0);
  // Contract count of the shape: the wing size for a butterfly, the common
  // size everywhere else.
  double q = legs.front().quantity;
  for (const auto& leg : legs) {
    q = std::min(q, leg.quantity);
  }

  auto spreadBounds = [&](double width, bool debit_form) {
    const double span = width * kMultiplier * q;
    if (debit_form) {
      out.max_loss = debit;
      out.max_profit = std::max(0.0, span - debit);
    } else {
      out.max_profit = credit;
      out.max_loss = std::max(0.0, span - credit);
    }
  };

  switch (out.type) {
    case StrategyType::LongCall:
      out.max_loss = debit;
      out.max_profit = kUnbounded;
      break;
    case StrategyType::LongPut:
      out.max_loss = debit;
      out.max_profit =
          std::max(0.0, legs.front().strike * kMultiplier * q - debit);
      break;
    case StrategyType::ShortCall:
      out.max_loss = kUnbounded;
      out.max_profit = credit;
      break;
    case StrategyType::ShortPut:
      out.max_loss =
          std::max(0.0, legs.front().strike * kMultiplier * q - credit);
      out.max_profit = credit;
      break;

    case StrategyType::CallDebitSpread:
    case StrategyType::PutDebitSpread:
      spreadBounds(std::fabs(legs[0].strike - legs[1].strike), true);
      break;
    case StrategyType::CallCreditSpread:
    case StrategyType::PutCreditSpread:
      spreadBounds(std::fabs(legs[0].strike - legs[1].strike), false);
      break;

    case StrategyType::Butterfly: {
      const OptionLeg* lo = &legs[0];
      const OptionLeg* hi = &legs[0];
      for (const auto& leg : legs) {
        if (leg.strike < lo->strike) {
          lo = &leg;
        }
        if (leg.strike > hi->strike) {
          hi = &leg;
        }
      }
      spreadBounds((hi->strike - lo->strike) / 2.0,
                   debitForm(out.net_cost, lo->isLong()));
      break;
    }

    case StrategyType::IronCondor:
    case StrategyType::IronButterfly: {
      const OptionLeg* lc = find(legs, OptionType::Call, Side::Buy);
      const OptionLeg* sc = find(legs, OptionType::Call, Side::Sell);
      const OptionLeg* lp = find(legs, OptionType::Put, Side::Buy);
      const OptionLeg* sp = find(legs, OptionType::Put, Side::Sell);
      const bool longs_inside = lc->strike < sc->strike;
      spreadBounds(std::max(std::fabs(lc->strike - sc->strike),
                            std::fabs(lp->strike - sp->strike)),
                   debitForm(out.net_cost, longs_inside));
      break;
    }

    case StrategyType::LongStraddle:
    case StrategyType::LongStrangle:
      out.max_loss = debit;
      out.max_profit = kUnbounded;
      break;
    case StrategyType::ShortStraddle:
    case StrategyType::ShortStrangle:
      out.max_loss = kUnbounded;
      out.max_profit = credit;
      break;

    case StrategyType::CalendarSpread:
    case StrategyType::DiagonalSpread:
      if (out.net_cost > 0.0) {
        out.max_loss = debit;
        out.max_profit = kUnbounded;
      } else {
        out.max_loss = kUnbounded;
        out.max_profit = credit;
      }
      break;

    case StrategyType::RatioSpread: {
      const auto extremes = piecewiseExtremes(legs);
      out.max_loss = extremes.first;
      out.max_profit = extremes.second;
      break;
    }

    case StrategyType::Custom:
      out.max_loss = kUnbounded;
      out.max_profit = kUnbounded;
      break;
  }
}

}  // namespace optrisk
