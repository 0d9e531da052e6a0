#include "optrisk/ledger/lot_ledger.hpp"
#include "optrisk/domain/errors.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <string>

namespace optrisk {

// -----------------------------------------------------------------------------
// fold(): replay the ordered history through per-symbol lot queues
// -----------------------------------------------------------------------------
LedgerSnapshot LotLedger::fold(
    const std::vector<domain::Transaction>& transactions) {
  std::vector<domain::Transaction> ordered(transactions);
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const domain::Transaction& a,
                      const domain::Transaction& b) {
                     return a.timestamp_ms < b.timestamp_ms;
                   });

  std::map<std::string, std::deque<Lot>> lots;
  std::map<std::string, domain::RealizedPnl> realized;

  for (const auto& tx : ordered) {
    auto& queue = lots[tx.symbol];

    if (tx.side == domain::Side::Buy) {
      queue.push_back(Lot{tx.quantity, tx.price + tx.fee / tx.quantity});
      continue;
    }

    // ---  SELL ---------------------------------------------------------------
    double held = 0.0;
    for (const auto& lot : queue) {
      held += lot.quantity;
    }
    if (tx.quantity > held + kQuantityEpsilon) {
      throw OversellError(tx.symbol, tx.quantity, held);
    }

    const double proceeds_per_unit = tx.price - tx.fee / tx.quantity;
    double remaining = tx.quantity;
    double pnl = 0.0;

    while (remaining > kQuantityEpsilon && !queue.empty()) {
      Lot& front = queue.front();
      if (front.quantity <= remaining + kQuantityEpsilon) {
        pnl += (proceeds_per_unit - front.cost_per_unit) * front.quantity;
        remaining -= front.quantity;
        queue.pop_front();
      } else {
        pnl += (proceeds_per_unit - front.cost_per_unit) * remaining;
        front.quantity -= remaining;
        remaining = 0.0;
      }
    }

    auto& entry = realized[tx.symbol];
    entry.symbol = tx.symbol;
    entry.realized += pnl;
    entry.trades += 1;
  }

  // ---  Project lots into the snapshot (std::map keeps symbols sorted) ------
  LedgerSnapshot snapshot;

  for (const auto& [symbol, queue] : lots) {
    domain::Position pos;
    pos.symbol = symbol;
    for (const auto& lot : queue) {
      pos.quantity += lot.quantity;
      pos.cost_basis += lot.quantity * lot.cost_per_unit;
    }
    if (pos.quantity <= kQuantityEpsilon) {
      continue;
    }
    pos.average_cost = pos.cost_basis / pos.quantity;
    snapshot.positions.push_back(std::move(pos));
  }

  for (const auto& [symbol, entry] : realized) {
    snapshot.total_realized += entry.realized;
    snapshot.total_trades += entry.trades;
    snapshot.realized.push_back(entry);
  }

  return snapshot;
}

}  // namespace optrisk
