#ifndef PAYMENTS_MUTATION_HPP_
#define PAYMENTS_MUTATION_HPP_

#include "core/amount.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace payments {

using ClientId = std::uint16_t;
using TransactionId = std::uint32_t;

// Input record kinds, as named in the input stream.
enum class TransactionType {
  DEPOSIT,
  WITHDRAWAL,
  DISPUTE,
  RESOLVE,
  CHARGEBACK
};

std::string transactionTypeName(TransactionType type);
std::optional<TransactionType> parseTransactionType(const std::string& name);

// Deposits and withdrawals move money and carry an amount; the dispute family
// refers back to one of them by id.
bool carriesAmount(TransactionType type);

/**
 * A single validated input instruction applied to one account.
 */
struct Mutation {
  TransactionId id = 0;
  TransactionType type = TransactionType::DEPOSIT;
  ClientId client_id = 0;
  std::optional<Amount> amount;

  static Mutation deposit(TransactionId id, ClientId client_id, Amount amount);
  static Mutation withdrawal(TransactionId id, ClientId client_id, Amount amount);
  static Mutation dispute(TransactionId id, ClientId client_id);
  static Mutation resolve(TransactionId id, ClientId client_id);
  static Mutation chargeback(TransactionId id, ClientId client_id);
};

// Outcome of applying a mutation.
enum class MutationStatus {
  SUCCESS,
  IGNORED,
  LOCKED_ACCOUNT,
  INSUFFICIENT_FUNDS,
  ONLY_DEPOSITS_DISPUTABLE,
  ARITHMETIC_ERROR,
  ARITHMETIC_OVERFLOW,
  INVALID_MUTATION,
  DUPLICATE_TRANSACTION
};

std::string mutationStatusName(MutationStatus status);

struct MutationResult {
  MutationStatus status = MutationStatus::SUCCESS;
  TransactionId transaction_id = 0;
  std::optional<Amount> amount;
  std::string message;

  // True when processing may continue: the record was applied or ignored.
  bool ok() const {
    return status == MutationStatus::SUCCESS || status == MutationStatus::IGNORED;
  }

  static MutationResult success(TransactionId id);
  static MutationResult ignored(TransactionId id, const std::string& reason);
  static MutationResult error(MutationStatus status, TransactionId id,
                              std::optional<Amount> amount, const std::string& message);
};

}  // namespace payments

#endif  // PAYMENTS_MUTATION_HPP_
