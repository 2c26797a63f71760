#include "core/ledger.hpp"

namespace payments {

std::string transactionStatusName(TransactionStatus status) {
  switch (status) {
    case TransactionStatus::OK: return "ok";
    case TransactionStatus::DISPUTED: return "disputed";
    case TransactionStatus::RESOLVED: return "resolved";
    case TransactionStatus::REFUNDED: return "refunded";
    default: return "unknown";
  }
}

bool Ledger::insert(const LedgerEntry& entry) {
  return entries_.emplace(entry.id, entry).second;
}

LedgerEntry* Ledger::find(TransactionId id) {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : &it->second;
}

const LedgerEntry* Ledger::find(TransactionId id) const {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : &it->second;
}

bool Ledger::contains(TransactionId id) const {
  return entries_.find(id) != entries_.end();
}

}  // namespace payments
