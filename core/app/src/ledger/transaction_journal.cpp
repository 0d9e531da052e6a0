#include "optrisk/ledger/transaction_journal.hpp"

#include <utility>

namespace optrisk {

// -----------------------------------------------------------------------------
// Constructor: adopt a history only if it folds cleanly
// -----------------------------------------------------------------------------
TransactionJournal::TransactionJournal(
    std::vector<domain::Transaction> history) {
  LotLedger::fold(history);
  log_ = std::move(history);
}

// -----------------------------------------------------------------------------
// applyTransaction(): fold the candidate log before committing the append
// -----------------------------------------------------------------------------
void TransactionJournal::applyTransaction(const domain::Transaction& tx) {
  std::vector<domain::Transaction> candidate(log_);
  candidate.push_back(tx);
  LotLedger::fold(candidate);
  log_ = std::move(candidate);
}

LedgerSnapshot TransactionJournal::recomputePositions() const {
  return LotLedger::fold(log_);
}

}  // namespace optrisk
