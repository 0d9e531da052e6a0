#include "optrisk/probability/probability_analyzer.hpp"
#include "optrisk/domain/errors.hpp"
#include "optrisk/pricing/black_scholes.hpp"
#include "optrisk/pricing/greeks_engine.hpp"
#include "optrisk/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace optrisk {

namespace {

// Bisection on a boolean predicate that differs at a and b.
template <typename Pred>
double bisect(double a, double b, Pred pred, int iterations) {
  const bool at_a = pred(a);
  for (int i = 0; i < iterations; ++i) {
    const double mid = 0.5 * (a + b);
    if (pred(mid) == at_a) {
      a = mid;
    } else {
      b = mid;
    }
  }
  return 0.5 * (a + b);
}

double clampPercent(double p) { return std::min(100.0, std::max(0.0, p)); }

// Lognormal mass of the prices where pred holds. Region edges are the sign
// changes of pred along xs; below xs.front() and above xs.back() pred is
// taken to keep its value at the end points.
template <typename Pred>
double massWhere(const std::vector<double>& xs, Pred pred, double spot,
                 double sigma, double tau, double r, double q,
                 int iterations) {
  double mass = 0.0;
  bool inside = pred(xs.front());
  double lo = 0.0;
  for (std::size_t i = 1; i < xs.size(); ++i) {
    if (pred(xs[i]) == inside) {
      continue;
    }
    const double edge = bisect(xs[i - 1], xs[i], pred, iterations);
    if (inside) {
      mass += lognormalCdf(edge, spot, sigma, tau, r, q) -
              lognormalCdf(lo, spot, sigma, tau, r, q);
    }
    lo = edge;
    inside = !inside;
  }
  if (inside) {
    mass += 1.0 - lognormalCdf(lo, spot, sigma, tau, r, q);
  }
  return mass;
}

}  // namespace

double lognormalCdf(double x, double s0, double sigma, double tau, double r,
                    double q) {
  if (x <= 0.0) {
    return 0.0;
  }
  if (tau <= 0.0) {
    return x >= s0 ? 1.0 : 0.0;
  }
  if (sigma <= 0.0) {
    return x >= s0 * std::exp((r - q) * tau) ? 1.0 : 0.0;
  }
  const double mean = std::log(s0) + (r - q - 0.5 * sigma * sigma) * tau;
  return normCdf((std::log(x) - mean) / (sigma * std::sqrt(tau)));
}

// -----------------------------------------------------------------------------
// analyze(): build the profile once, then derive every figure from it
// -----------------------------------------------------------------------------
domain::ProbabilitySummary ProbabilityAnalyzer::analyze(
    const std::vector<domain::OptionLeg>& legs,
    const domain::StrategyClassification& classification,
    std::int64_t valuation_ms) const {
  if (legs.empty()) {
    throw InputError("probability analysis needs at least one leg");
  }

  PayoffProfile profile(legs, GreeksEngine(config_));
  const double spot = legs.front().current_price;
  const double sigma = legs.front().volatility;
  const std::int64_t valuation_day = ms_to_epoch_day(valuation_ms);
  const double tau =
      year_fraction(days_to_expiry(profile.horizonDay(), valuation_ms));

  domain::ProbabilitySummary out;
  out.current_price = spot;
  out.breakevens = findBreakevens(profile, spot);
  out.pop_expiration =
      probabilityOfProfit(profile, out.breakevens, spot, sigma, tau);
  out.profit_50_probability =
      earlyExitProbability(profile, classification, 0.50, spot, sigma,
                           valuation_day);
  out.profit_25_probability =
      earlyExitProbability(profile, classification, 0.25, spot, sigma,
                           valuation_day);
  return out;
}

std::vector<double> ProbabilityAnalyzer::grid(const PayoffProfile& profile,
                                              double spot) const {
  const double hi =
      3.0 * std::max(spot, profile.maxStrike()) + profile.premiumPerShare();
  const double step =
      (hi - kGridFloor) / static_cast<double>(kGridPoints - 1);

  std::vector<double> xs(kGridPoints);
  for (int i = 0; i < kGridPoints; ++i) {
    xs[static_cast<std::size_t>(i)] = kGridFloor + step * static_cast<double>(i);
  }
  return xs;
}

// -----------------------------------------------------------------------------
// findBreakevens(): closed form for one leg, grid scan + bisection otherwise
// -----------------------------------------------------------------------------
std::vector<double> ProbabilityAnalyzer::findBreakevens(
    const PayoffProfile& profile, double spot) const {
  const auto& legs = profile.legs();

  if (legs.size() == 1) {
    const auto& leg = legs.front();
    const double per_share = leg.premium / GreeksEngine::kContractMultiplier;
    const double be = leg.type == domain::OptionType::Call
                          ? leg.strike + per_share
                          : leg.strike - per_share;
    if (be > 0.0) {
      return {be};
    }
    return {};
  }

  auto profitable = [&profile](double x) { return profile.pnlAt(x) > 0.0; };

  const std::vector<double> xs = grid(profile, spot);
  std::vector<double> roots;

  bool prev = profitable(xs.front());
  for (std::size_t i = 1; i < xs.size(); ++i) {
    const bool cur = profitable(xs[i]);
    if (cur != prev) {
      const double root =
          bisect(xs[i - 1], xs[i], profitable, kBisectionIterations);
      if (roots.empty() || root - roots.back() > kRootTolerance) {
        roots.push_back(root);
      }
    }
    prev = cur;
  }
  return roots;
}

// -----------------------------------------------------------------------------
// probabilityOfProfit(): lognormal mass of the profitable intervals
// -----------------------------------------------------------------------------
double ProbabilityAnalyzer::probabilityOfProfit(
    const PayoffProfile& profile, const std::vector<double>& breakevens,
    double spot, double sigma, double tau) const {
  const double r = config_.risk_free_rate;
  const double q = config_.dividend_yield;

  if (breakevens.empty()) {
    return profile.pnlAt(spot) > 0.0 ? 100.0 : 0.0;
  }

  std::vector<double> bounds;
  bounds.reserve(breakevens.size() + 2);
  bounds.push_back(0.0);
  bounds.insert(bounds.end(), breakevens.begin(), breakevens.end());
  bounds.push_back(std::numeric_limits<double>::infinity());

  double mass = 0.0;
  for (std::size_t i = 0; i + 1 < bounds.size(); ++i) {
    const double lo = bounds[i];
    const double hi = bounds[i + 1];
    const double inner = std::isinf(hi) ? lo * 1.1 + 1.0 : 0.5 * (lo + hi);
    if (profile.pnlAt(inner) <= 0.0) {
      continue;
    }
    const double cdf_hi =
        std::isinf(hi) ? 1.0 : lognormalCdf(hi, spot, sigma, tau, r, q);
    const double cdf_lo = lognormalCdf(lo, spot, sigma, tau, r, q);
    mass += cdf_hi - cdf_lo;
  }
  return clampPercent(mass * 100.0);
}

// -----------------------------------------------------------------------------
// earlyExitProbability(): mass of the prices whose interim mark meets target
// -----------------------------------------------------------------------------
double ProbabilityAnalyzer::earlyExitProbability(
    const PayoffProfile& profile,
    const domain::StrategyClassification& classification, double fraction,
    double spot, double sigma, std::int64_t valuation_day) const {
  const double basis = domain::isUnbounded(classification.max_profit)
                           ? std::fabs(classification.net_cost)
                           : classification.max_profit;
  const double target = fraction * basis;
  if (target <= 0.0) {
    return 0.0;
  }

  const std::int64_t remaining =
      std::max<std::int64_t>(0, profile.horizonDay() - valuation_day);
  const std::int64_t check_day = valuation_day + remaining / 2;
  const double tau = year_fraction(check_day - valuation_day);

  auto reaches = [&profile, check_day, target](double x) {
    return profile.markedPnlAt(x, check_day) >= target;
  };

  const double mass =
      massWhere(grid(profile, spot), reaches, spot, sigma, tau,
                config_.risk_free_rate, config_.dividend_yield,
                kBisectionIterations);
  return clampPercent(mass * 100.0);
}

}  // namespace optrisk
