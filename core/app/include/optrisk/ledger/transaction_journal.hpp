#pragma once

#include "optrisk/domain/transaction.hpp"
#include "optrisk/ledger/lot_ledger.hpp"

#include <vector>

namespace optrisk {

// -----------------------------------------------------------------------------
// TransactionJournal — append-only transaction log
// -----------------------------------------------------------------------------
//
// @brief  The one mutable piece of portfolio state. Positions are never
//         stored; they are folded from the journal on demand.
//
// @details
// applyTransaction() refuses any append that would oversell, so every
// journal state folds cleanly. A rejected append leaves the journal as it
// was.
//
// Thread-safety: Not thread-safe. The owner serialises access (the IPC
//                server handles one request at a time).
// -----------------------------------------------------------------------------
class TransactionJournal {
 public:
  TransactionJournal() = default;
  explicit TransactionJournal(std::vector<domain::Transaction> history);

  // -------------------------------------------------------------------------
  // applyTransaction(tx)
  // -------------------------------------------------------------------------
  // @throws OversellError if tx would sell more than is held at its
  //         timestamp. The journal is unchanged in that case.
  // -------------------------------------------------------------------------
  void applyTransaction(const domain::Transaction& tx);

  LedgerSnapshot recomputePositions() const;

  const std::vector<domain::Transaction>& transactions() const {
    return log_;
  }

  std::size_t size() const { return log_.size(); }

 private:
  std::vector<domain::Transaction> log_;
};

}  // namespace optrisk
