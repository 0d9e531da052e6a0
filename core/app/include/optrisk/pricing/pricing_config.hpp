#pragma once

namespace optrisk {

// -----------------------------------------------------------------------------
// PricingConfig — market parameters shared by every valuation
// -----------------------------------------------------------------------------
// risk_free_rate and dividend_yield are continuously compounded annual
// rates as decimals. Loaded from the "pricing" section of the engine
// config.
// -----------------------------------------------------------------------------
struct PricingConfig {
  double risk_free_rate{0.05};
  double dividend_yield{0.0};
};

}  // namespace optrisk
