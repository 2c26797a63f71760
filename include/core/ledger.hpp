#ifndef PAYMENTS_LEDGER_HPP_
#define PAYMENTS_LEDGER_HPP_

#include "core/mutation.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace payments {

// Lifecycle of a stored transaction. Transitions only move forward:
// OK -> DISPUTED -> RESOLVED -> REFUNDED.
enum class TransactionStatus {
  OK,
  DISPUTED,
  RESOLVED,
  REFUNDED
};

std::string transactionStatusName(TransactionStatus status);

/**
 * A deposit or withdrawal that has been applied to an account.
 * The amount never changes after creation; only the status advances.
 */
struct LedgerEntry {
  TransactionId id = 0;
  TransactionType type = TransactionType::DEPOSIT;
  ClientId client_id = 0;
  Amount amount = 0;
  TransactionStatus status = TransactionStatus::OK;
};

/**
 * History of every applied deposit and withdrawal, keyed by transaction id.
 *
 * Dispute, resolve and chargeback records carry no amount of their own, so
 * they are resolved against this table. Entries live for the whole run since
 * any later record may refer to any earlier transaction.
 */
class Ledger {
 public:
  Ledger() = default;

  // Non-copyable
  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;

  /**
   * Stores a new entry. Returns false and leaves the ledger unchanged if an
   * entry with the same id already exists.
   */
  bool insert(const LedgerEntry& entry);

  LedgerEntry* find(TransactionId id);
  const LedgerEntry* find(TransactionId id) const;

  bool contains(TransactionId id) const;
  std::size_t size() const { return entries_.size(); }

 private:
  std::unordered_map<TransactionId, LedgerEntry> entries_;
};

}  // namespace payments

#endif  // PAYMENTS_LEDGER_HPP_
