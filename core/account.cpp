#include "core/account.hpp"

#include <string>

namespace payments {

namespace {

std::string describe(const char* action, TransactionId id, Amount amount) {
  return std::string("Can't ") + action + " " + formatAmount(amount) +
         " on transaction " + std::to_string(id);
}

}  // namespace

Account::Account(ClientId client_id) : client_id_(client_id) {}

bool Account::isConsistent() const {
  auto sum = checkedAdd(available_, held_);
  return sum.has_value() && *sum == total_;
}

MutationResult Account::mutate(const Mutation& mutation, Ledger& ledger) {
  if (locked_) {
    return MutationResult::error(
        MutationStatus::LOCKED_ACCOUNT, mutation.id, mutation.amount,
        "Attempt to mutate account " + std::to_string(client_id_) + ", which is locked");
  }

  if (carriesAmount(mutation.type) != mutation.amount.has_value()) {
    return MutationResult::error(
        MutationStatus::INVALID_MUTATION, mutation.id, mutation.amount,
        transactionTypeName(mutation.type) +
            (mutation.amount ? " may not carry an amount" : " requires an amount"));
  }

  switch (mutation.type) {
    case TransactionType::DEPOSIT:
      return processDeposit(mutation, ledger);
    case TransactionType::WITHDRAWAL:
      return processWithdrawal(mutation, ledger);
    case TransactionType::DISPUTE:
      return processDispute(mutation.id, ledger);
    case TransactionType::RESOLVE:
      return processResolve(mutation.id, ledger);
    case TransactionType::CHARGEBACK:
      return processChargeback(mutation.id, ledger);
  }
  return MutationResult::error(MutationStatus::INVALID_MUTATION, mutation.id,
                               mutation.amount, "Unknown transaction type");
}

MutationResult Account::processDeposit(const Mutation& mutation, Ledger& ledger) {
  const Amount amount = *mutation.amount;
  auto available = checkedAdd(available_, amount);
  auto total = checkedAdd(total_, amount);
  if (!available || !total) {
    return MutationResult::error(MutationStatus::ARITHMETIC_OVERFLOW, mutation.id, amount,
                                 describe("deposit", mutation.id, amount));
  }

  LedgerEntry entry{mutation.id, TransactionType::DEPOSIT, client_id_, amount,
                    TransactionStatus::OK};
  if (!ledger.insert(entry)) {
    return MutationResult::error(MutationStatus::DUPLICATE_TRANSACTION, mutation.id, amount,
                                 "Transaction " + std::to_string(mutation.id) + " already exists");
  }

  available_ = *available;
  total_ = *total;
  return MutationResult::success(mutation.id);
}

MutationResult Account::processWithdrawal(const Mutation& mutation, Ledger& ledger) {
  const Amount amount = *mutation.amount;
  // Both balances move together or not at all.
  auto available = checkedSub(available_, amount);
  auto total = checkedSub(total_, amount);
  if (!available || !total) {
    return MutationResult::error(MutationStatus::INSUFFICIENT_FUNDS, mutation.id, amount,
                                 describe("withdraw", mutation.id, amount));
  }

  LedgerEntry entry{mutation.id, TransactionType::WITHDRAWAL, client_id_, amount,
                    TransactionStatus::OK};
  if (!ledger.insert(entry)) {
    return MutationResult::error(MutationStatus::DUPLICATE_TRANSACTION, mutation.id, amount,
                                 "Transaction " + std::to_string(mutation.id) + " already exists");
  }

  available_ = *available;
  total_ = *total;
  return MutationResult::success(mutation.id);
}

MutationResult Account::processDispute(TransactionId id, Ledger& ledger) {
  LedgerEntry* entry = ledger.find(id);
  if (entry == nullptr) {
    return MutationResult::ignored(id, "dispute references an unknown transaction");
  }
  if (entry->type != TransactionType::DEPOSIT) {
    return MutationResult::error(
        MutationStatus::ONLY_DEPOSITS_DISPUTABLE, id, entry->amount,
        "Cannot dispute " + std::to_string(id) + ", only deposits can be disputed");
  }
  if (entry->status != TransactionStatus::OK) {
    return MutationResult::ignored(
        id, "dispute on a transaction that is " + transactionStatusName(entry->status));
  }

  auto available = checkedSub(available_, entry->amount);
  if (!available) {
    return MutationResult::error(MutationStatus::ARITHMETIC_ERROR, id, entry->amount,
                                 describe("dispute", id, entry->amount));
  }
  auto held = checkedAdd(held_, entry->amount);
  if (!held) {
    return MutationResult::error(MutationStatus::ARITHMETIC_OVERFLOW, id, entry->amount,
                                 describe("dispute", id, entry->amount));
  }

  available_ = *available;
  held_ = *held;
  entry->status = TransactionStatus::DISPUTED;
  return MutationResult::success(id);
}

MutationResult Account::processResolve(TransactionId id, Ledger& ledger) {
  LedgerEntry* entry = ledger.find(id);
  if (entry == nullptr || entry->status != TransactionStatus::DISPUTED) {
    return MutationResult::ignored(id, "resolve on a transaction that is not disputed");
  }

  auto available = checkedAdd(available_, entry->amount);
  if (!available) {
    return MutationResult::error(MutationStatus::ARITHMETIC_OVERFLOW, id, entry->amount,
                                 describe("resolve", id, entry->amount));
  }
  auto held = checkedSub(held_, entry->amount);
  if (!held) {
    return MutationResult::error(MutationStatus::ARITHMETIC_ERROR, id, entry->amount,
                                 describe("resolve", id, entry->amount));
  }

  available_ = *available;
  held_ = *held;
  entry->status = TransactionStatus::RESOLVED;
  return MutationResult::success(id);
}

MutationResult Account::processChargeback(TransactionId id, Ledger& ledger) {
  LedgerEntry* entry = ledger.find(id);
  if (entry == nullptr || entry->status != TransactionStatus::RESOLVED) {
    return MutationResult::ignored(id, "chargeback on a transaction that is not resolved");
  }

  auto available = checkedSub(available_, entry->amount);
  auto total = checkedSub(total_, entry->amount);
  if (!available || !total) {
    return MutationResult::error(MutationStatus::ARITHMETIC_ERROR, id, entry->amount,
                                 describe("chargeback", id, entry->amount));
  }

  available_ = *available;
  total_ = *total;
  locked_ = true;
  entry->status = TransactionStatus::REFUNDED;
  return MutationResult::success(id);
}

}  // namespace payments
