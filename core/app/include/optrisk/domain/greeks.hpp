#pragma once

namespace optrisk {
namespace domain {

// -----------------------------------------------------------------------------
// GreeksVector — position-level sensitivities
// -----------------------------------------------------------------------------
//
// @brief  Delta, gamma, theta, vega and rho in exposure units: share-
//         equivalent delta, theta per calendar day, vega and rho per one
//         percentage point.
//
// @details
// Greeks of a book are the sum of the Greeks of its legs, so the vector is
// closed under addition and scaling.
// -----------------------------------------------------------------------------
struct GreeksVector {
  double delta{0.0};
  double gamma{0.0};
  double theta{0.0};
  double vega{0.0};
  double rho{0.0};

  GreeksVector& operator+=(const GreeksVector& other) {
    delta += other.delta;
    gamma += other.gamma;
    theta += other.theta;
    vega += other.vega;
    rho += other.rho;
    return *this;
  }
};

inline GreeksVector operator+(GreeksVector lhs, const GreeksVector& rhs) {
  lhs += rhs;
  return lhs;
}

inline GreeksVector operator*(GreeksVector g, double k) {
  g.delta *= k;
  g.gamma *= k;
  g.theta *= k;
  g.vega *= k;
  g.rho *= k;
  return g;
}

inline GreeksVector operator*(double k, const GreeksVector& g) {
  return g * k;
}

}  // namespace domain
}  // namespace optrisk
