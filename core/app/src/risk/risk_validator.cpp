#include "optrisk/risk/risk_validator.hpp"
#include "optrisk/domain/errors.hpp"
#include "optrisk/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <string>
#include <utility>

namespace optrisk {

using domain::RiskCheck;
using domain::RiskLevel;

namespace {

std::string fixed(double v, int precision) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(precision) << v;
  return os.str();
}

std::string money(double v) {
  if (domain::isUnbounded(v)) {
    return "unlimited";
  }
  return "$" + fixed(v, 2);
}

RiskCheck make(std::string name, RiskLevel level, std::string message,
               std::optional<double> current = std::nullopt,
               std::optional<double> limit = std::nullopt) {
  RiskCheck c;
  c.name = std::move(name);
  c.level = level;
  c.message = std::move(message);
  c.current_value = current;
  c.limit_value = limit;
  return c;
}

}  // namespace

RiskValidator::RiskValidator(const domain::RiskLimits& limits,
                             const PricingConfig& pricing,
                             const ITimeProvider& clock)
    : limits_(limits),
      greeks_(pricing),
      probability_(pricing),
      clock_(clock) {}

// -----------------------------------------------------------------------------
// validate(): classify, price, analyse, then run every check in order
// -----------------------------------------------------------------------------
domain::ValidationResult RiskValidator::validate(
    const ValidationRequest& request) const {
  if (!std::isfinite(request.portfolio_cash)) {
    throw InputError("portfolio_cash must be a finite number");
  }

  const std::int64_t valuation_ms =
      request.valuation_ms ? *request.valuation_ms : clock_.now_ms();

  domain::ValidationResult result;
  result.classification = classifier_.classify(request.new_legs);

  result.greeks.current = greeks_.aggregate(request.existing_legs, valuation_ms);
  result.greeks.new_trade = greeks_.aggregate(request.new_legs, valuation_ms);
  result.greeks.combined = result.greeks.current + result.greeks.new_trade;

  result.probability = probability_.analyze(
      request.new_legs, result.classification, valuation_ms);

  auto& checks = result.checks;
  checkGreeks(result.greeks, checks);
  checks.push_back(
      checkCapital(result.classification.net_cost, request.portfolio_cash));
  checks.push_back(checkProbability(result.probability.pop_expiration,
                                    request.risk_profile));

  if (result.classification.isCredit()) {
    std::optional<double> rank = request.iv_rank;
    if (!rank) {
      rank = ivRank(request.new_legs.front().volatility, request.iv_history);
    }
    checks.push_back(checkIvRank(rank));
  }

  checks.push_back(checkSymbolConcentration(request));
  checks.push_back(checkEarlyAssignment(request, valuation_ms));
  checks.push_back(checkExpirationConcentration(request));
  checks.push_back(checkStrikeConcentration(request));

  const double cost = result.classification.net_cost;
  checks.push_back(make("debit_credit", RiskLevel::Info,
                        cost > 0.0 ? "Net debit of " + money(cost)
                                   : "Net credit of " + money(-cost),
                        cost));

  checks.push_back(make(
      "max_loss_profit", RiskLevel::Info,
      std::string(domain::toString(result.classification.type)) +
          ": max loss " + money(result.classification.max_loss) +
          ", max profit " + money(result.classification.max_profit)));

  result.passed = std::none_of(checks.begin(), checks.end(),
                               [](const RiskCheck& c) {
                                 return c.level == RiskLevel::Blocker;
                               });
  return result;
}

// -----------------------------------------------------------------------------
// checkGreeks(): caps on |combined| exposure
// -----------------------------------------------------------------------------
void RiskValidator::checkGreeks(const domain::GreeksImpact& impact,
                                std::vector<RiskCheck>& out) const {
  const domain::GreeksVector& combined = impact.combined;
  const std::size_t before = out.size();

  const std::string trade_delta =
      "; new trade contributes " + fixed(impact.new_trade.delta, 1);
  const double delta = std::fabs(combined.delta);
  if (delta > limits_.max_delta) {
    out.push_back(make("portfolio_delta", RiskLevel::Blocker,
                       "Portfolio delta (" + fixed(combined.delta, 1) +
                           ") exceeds limit (±" + fixed(limits_.max_delta, 0) +
                           ")" + trade_delta,
                       delta, limits_.max_delta));
  } else if (delta > limits_.max_delta * limits_.delta_warning_fraction) {
    out.push_back(make("portfolio_delta", RiskLevel::Warning,
                       "Portfolio delta (" + fixed(combined.delta, 1) +
                           ") approaching limit" + trade_delta,
                       delta, limits_.max_delta));
  }

  const double gamma = std::fabs(combined.gamma);
  if (gamma > limits_.max_gamma) {
    out.push_back(make("portfolio_gamma", RiskLevel::Blocker,
                       "Portfolio gamma (" + fixed(combined.gamma, 2) +
                           ") exceeds limit (±" + fixed(limits_.max_gamma, 0) + ")",
                       gamma, limits_.max_gamma));
  }

  const double vega = std::fabs(combined.vega);
  if (vega > limits_.max_vega) {
    out.push_back(make("portfolio_vega", RiskLevel::Blocker,
                       "Portfolio vega ($" + fixed(combined.vega, 0) +
                           ") exceeds limit ($±" + fixed(limits_.max_vega, 0) + ")",
                       vega, limits_.max_vega));
  }

  const double theta = std::fabs(combined.theta);
  if (theta > limits_.max_theta) {
    out.push_back(make("portfolio_theta", RiskLevel::Blocker,
                       "Daily theta ($" + fixed(combined.theta, 0) +
                           ") exceeds limit ($±" + fixed(limits_.max_theta, 0) + ")",
                       theta, limits_.max_theta));
  }

  if (out.size() == before) {
    out.push_back(make("greeks_limits", RiskLevel::Pass,
                       "All portfolio Greeks within limits"));
  }
}

RiskCheck RiskValidator::checkCapital(double cost, double cash) const {
  if (cost <= 0.0) {
    return make("capital_requirement", RiskLevel::Pass,
                "Credit strategy receives " + money(-cost), cash, 0.0);
  }
  if (cost > cash) {
    return make("capital_requirement", RiskLevel::Blocker,
                "Insufficient capital: need " + money(cost) + ", have " +
                    money(cash),
                cash, cost);
  }
  const double used = cost / cash * 100.0;
  if (cost > cash * limits_.capital_warning_fraction) {
    return make("capital_requirement", RiskLevel::Warning,
                "Trade uses " + fixed(used, 1) + "% of available capital",
                cost, cash);
  }
  return make("capital_requirement", RiskLevel::Pass,
              "Capital requirement: " + money(cost) + " (" + fixed(used, 1) +
                  "% of available)",
              cost, cash);
}

RiskCheck RiskValidator::checkProbability(double pop,
                                          domain::RiskProfile profile) const {
  const double min_pop = limits_.minPop(profile);
  if (pop < min_pop) {
    return make("probability_of_profit", RiskLevel::Warning,
                "PoP (" + fixed(pop, 1) + "%) below " + fixed(min_pop, 0) +
                    "% threshold for " + domain::toString(profile) + " profile",
                pop, min_pop);
  }
  return make("probability_of_profit", RiskLevel::Pass,
              "PoP (" + fixed(pop, 1) + "%) meets " + fixed(min_pop, 0) +
                  "% threshold",
              pop, min_pop);
}

std::optional<double> RiskValidator::ivRank(
    double current_iv, const std::vector<double>& history) {
  if (history.empty()) {
    return std::nullopt;
  }
  const auto [lo, hi] = std::minmax_element(history.begin(), history.end());
  const double range = *hi - *lo;
  if (range <= 0.0) {
    return std::nullopt;
  }
  const double rank = (current_iv - *lo) / range * 100.0;
  return std::min(100.0, std::max(0.0, rank));
}

RiskCheck RiskValidator::checkIvRank(std::optional<double> rank) const {
  if (!rank) {
    return make("iv_rank", RiskLevel::Info,
                "IV rank unavailable; credit strategies prefer high IV");
  }
  if (*rank < limits_.min_iv_rank_for_credit) {
    return make("iv_rank", RiskLevel::Warning,
                "IV rank (" + fixed(*rank, 0) + ") is below " +
                    fixed(limits_.min_iv_rank_for_credit, 0) +
                    " - credit strategies prefer high IV",
                *rank, limits_.min_iv_rank_for_credit);
  }
  return make("iv_rank", RiskLevel::Pass,
              "IV rank (" + fixed(*rank, 0) +
                  ") is favorable for credit strategies",
              *rank, limits_.min_iv_rank_for_credit);
}

// -----------------------------------------------------------------------------
// Concentration checks
// -----------------------------------------------------------------------------
RiskCheck RiskValidator::checkSymbolConcentration(
    const ValidationRequest& request) const {
  std::set<std::string> symbols;
  for (const auto& leg : request.new_legs) {
    symbols.insert(leg.symbol);
  }
  for (const auto& symbol : symbols) {
    const auto count = std::count_if(
        request.existing_legs.begin(), request.existing_legs.end(),
        [&symbol](const domain::OptionLeg& l) { return l.symbol == symbol; });
    if (count > limits_.max_legs_per_symbol) {
      return make("symbol_concentration", RiskLevel::Warning,
                  symbol + " already has " + std::to_string(count) +
                      " open positions - high concentration risk",
                  static_cast<double>(count),
                  static_cast<double>(limits_.max_legs_per_symbol));
    }
  }
  return make("symbol_concentration", RiskLevel::Pass,
              "No excessive symbol concentration detected");
}

RiskCheck RiskValidator::checkEarlyAssignment(const ValidationRequest& request,
                                              std::int64_t valuation_ms) const {
  for (const auto& leg : request.new_legs) {
    if (leg.isLong() || !leg.inTheMoney()) {
      continue;
    }
    const std::int64_t dte =
        std::max<std::int64_t>(0, days_to_expiry(leg.expiry_day, valuation_ms));
    if (dte >= limits_.early_assignment_days) {
      continue;
    }
    const double itm_pct =
        std::fabs(leg.current_price - leg.strike) / leg.current_price * 100.0;
    return make("early_assignment_risk", RiskLevel::Warning,
                std::string("Short ") + domain::toString(leg.type) + " at " +
                    money(leg.strike) + " is " + fixed(itm_pct, 1) +
                    "% in the money with " + std::to_string(dte) +
                    " days to expiry",
                itm_pct, static_cast<double>(limits_.early_assignment_days));
  }
  return make("early_assignment_risk", RiskLevel::Pass,
              "No short legs at risk of early assignment");
}

RiskCheck RiskValidator::checkExpirationConcentration(
    const ValidationRequest& request) const {
  int worst = 0;
  std::string worst_expiry;
  for (const auto& candidate : request.new_legs) {
    int count = 0;
    for (const auto* book : {&request.new_legs, &request.existing_legs}) {
      count += static_cast<int>(std::count_if(
          book->begin(), book->end(), [&candidate](const domain::OptionLeg& l) {
            return l.expiry_day == candidate.expiry_day;
          }));
    }
    if (count > worst) {
      worst = count;
      worst_expiry = candidate.expiry;
    }
  }
  if (worst > limits_.max_legs_per_expiry) {
    return make("expiration_concentration", RiskLevel::Warning,
                "High concentration: " + std::to_string(worst) +
                    " positions expiring " + worst_expiry,
                static_cast<double>(worst),
                static_cast<double>(limits_.max_legs_per_expiry));
  }
  return make("expiration_concentration", RiskLevel::Pass,
              "Expirations well distributed");
}

RiskCheck RiskValidator::checkStrikeConcentration(
    const ValidationRequest& request) const {
  int worst = 0;
  for (const auto& candidate : request.new_legs) {
    int count = 0;
    for (const auto* book : {&request.new_legs, &request.existing_legs}) {
      count += static_cast<int>(std::count_if(
          book->begin(), book->end(), [&candidate](const domain::OptionLeg& l) {
            return l.symbol == candidate.symbol &&
                   std::fabs(l.strike - candidate.strike) < 1e-9;
          }));
    }
    worst = std::max(worst, count);
  }
  if (worst > limits_.max_legs_per_strike) {
    return make("strike_concentration", RiskLevel::Warning,
                "High concentration: " + std::to_string(worst) +
                    " positions at same strike",
                static_cast<double>(worst),
                static_cast<double>(limits_.max_legs_per_strike));
  }
  return make("strike_concentration", RiskLevel::Pass,
              "Strikes well distributed");
}

}  // namespace optrisk
