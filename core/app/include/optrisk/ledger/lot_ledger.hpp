#pragma once

#include "optrisk/domain/position.hpp"
#include "optrisk/domain/transaction.hpp"

#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// LedgerSnapshot — everything a fold of the history produces
// -----------------------------------------------------------------------------
//
// @details
// positions and realized are sorted by symbol. realized lists every symbol
// that saw at least one SELL, including symbols that are now flat.
// -----------------------------------------------------------------------------
struct LedgerSnapshot {
  std::vector<domain::Position> positions;
  std::vector<domain::RealizedPnl> realized;
  double total_realized{0.0};
  int total_trades{0};

  int positionsCount() const { return static_cast<int>(positions.size()); }
};

// -----------------------------------------------------------------------------
// LotLedger — strict FIFO lot accounting
// -----------------------------------------------------------------------------
//
// @brief  Rebuilds holdings and realized P&L from a transaction history.
//
// @details
// Algorithm:
//   1. Stable-sort a copy of the history by timestamp_ms.
//   2. Per symbol keep a queue of open lots (oldest at the front).
//      BUY   → push a lot {qty, price + fee / qty} at the back.
//      SELL  → consume lots from the front. A lot no larger than the
//              remaining sell quantity is popped whole; otherwise it is
//              reduced in place. Each consumed unit realizes
//              (price - fee / qty) - lot cost.
//   3. Project the surviving lots into Position values.
//
// A SELL larger than the open quantity of its symbol is rejected with
// OversellError. Nothing is returned in that case; short lots are never
// created.
//
// Lots exist only inside fold(). Callers see Position and RealizedPnl
// values, never the lots themselves.
//
// Thread-safety: fold() is a pure function of its argument. Calling it
//                twice on the same history gives identical snapshots.
// -----------------------------------------------------------------------------
class LotLedger {
 public:
  // -------------------------------------------------------------------------
  // fold(transactions)
  // -------------------------------------------------------------------------
  //
  // @param  transactions  Full history, in any order.
  // @return Positions and realized P&L after replaying the history.
  //
  // @throws OversellError if any SELL exceeds the open lots of its symbol.
  // -------------------------------------------------------------------------
  static LedgerSnapshot fold(const std::vector<domain::Transaction>& transactions);

  // Quantities below this are treated as zero when matching lots.
  static constexpr double kQuantityEpsilon = 1e-9;

 private:
  struct Lot {
    double quantity;
    double cost_per_unit;
  };
};

}  // namespace optrisk
