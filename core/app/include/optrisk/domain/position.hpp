#pragma once

#include <string>

namespace optrisk {
namespace domain {

// -----------------------------------------------------------------------------
// Position — per-symbol holding derived from open lots
// -----------------------------------------------------------------------------
//
// @brief  Net open quantity and its cost for a single instrument.
//
// @details
// A Position is never stored or mutated: it is recomputed from the full
// transaction history by LotLedger::fold(). That keeps it consistent with
// the lots behind it by construction:
//
//   quantity     = sum of remaining lot quantities
//   cost_basis   = sum of (lot quantity * lot cost per unit)
//   average_cost = cost_basis / quantity
//
// Lot cost per unit already includes the buy fee (price + fee / qty).
// quantity is always > 0 here; flat symbols are omitted from a snapshot.
//
// Thread model:
//   Value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;         // Instrument identifier (e.g. "AAPL")
  double quantity{0.0};       // Open units, always positive
  double cost_basis{0.0};     // Total cost of the open lots
  double average_cost{0.0};   // cost_basis / quantity
};

// -----------------------------------------------------------------------------
// RealizedPnl — closed-lot profit for a single instrument
// -----------------------------------------------------------------------------
// trades counts the SELL transactions that contributed to realized.
// -----------------------------------------------------------------------------
struct RealizedPnl {
  std::string symbol;
  double realized{0.0};
  int trades{0};
};

}  // namespace domain
}  // namespace optrisk
