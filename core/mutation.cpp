#include "core/mutation.hpp"

namespace payments {

std::string transactionTypeName(TransactionType type) {
  switch (type) {
    case TransactionType::DEPOSIT: return "deposit";
    case TransactionType::WITHDRAWAL: return "withdrawal";
    case TransactionType::DISPUTE: return "dispute";
    case TransactionType::RESOLVE: return "resolve";
    case TransactionType::CHARGEBACK: return "chargeback";
    default: return "unknown";
  }
}

std::optional<TransactionType> parseTransactionType(const std::string& name) {
  if (name == "deposit") return TransactionType::DEPOSIT;
  if (name == "withdrawal") return TransactionType::WITHDRAWAL;
  if (name == "dispute") return TransactionType::DISPUTE;
  if (name == "resolve") return TransactionType::RESOLVE;
  if (name == "chargeback") return TransactionType::CHARGEBACK;
  return std::nullopt;
}

bool carriesAmount(TransactionType type) {
  return type == TransactionType::DEPOSIT || type == TransactionType::WITHDRAWAL;
}

Mutation Mutation::deposit(TransactionId id, ClientId client_id, Amount amount) {
  Mutation mutation;
  mutation.id = id;
  mutation.type = TransactionType::DEPOSIT;
  mutation.client_id = client_id;
  mutation.amount = amount;
  return mutation;
}

Mutation Mutation::withdrawal(TransactionId id, ClientId client_id, Amount amount) {
  Mutation mutation;
  mutation.id = id;
  mutation.type = TransactionType::WITHDRAWAL;
  mutation.client_id = client_id;
  mutation.amount = amount;
  return mutation;
}

Mutation Mutation::dispute(TransactionId id, ClientId client_id) {
  Mutation mutation;
  mutation.id = id;
  mutation.type = TransactionType::DISPUTE;
  mutation.client_id = client_id;
  return mutation;
}

Mutation Mutation::resolve(TransactionId id, ClientId client_id) {
  Mutation mutation;
  mutation.id = id;
  mutation.type = TransactionType::RESOLVE;
  mutation.client_id = client_id;
  return mutation;
}

Mutation Mutation::chargeback(TransactionId id, ClientId client_id) {
  Mutation mutation;
  mutation.id = id;
  mutation.type = TransactionType::CHARGEBACK;
  mutation.client_id = client_id;
  return mutation;
}

std::string mutationStatusName(MutationStatus status) {
  switch (status) {
    case MutationStatus::SUCCESS: return "SUCCESS";
    case MutationStatus::IGNORED: return "IGNORED";
    case MutationStatus::LOCKED_ACCOUNT: return "LOCKED_ACCOUNT";
    case MutationStatus::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
    case MutationStatus::ONLY_DEPOSITS_DISPUTABLE: return "ONLY_DEPOSITS_DISPUTABLE";
    case MutationStatus::ARITHMETIC_ERROR: return "ARITHMETIC_ERROR";
    case MutationStatus::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
    case MutationStatus::INVALID_MUTATION: return "INVALID_MUTATION";
    case MutationStatus::DUPLICATE_TRANSACTION: return "DUPLICATE_TRANSACTION";
    default: return "UNKNOWN";
  }
}

MutationResult MutationResult::success(TransactionId id) {
  MutationResult result;
  result.status = MutationStatus::SUCCESS;
  result.transaction_id = id;
  return result;
}

MutationResult MutationResult::ignored(TransactionId id, const std::string& reason) {
  MutationResult result;
  result.status = MutationStatus::IGNORED;
  result.transaction_id = id;
  result.message = reason;
  return result;
}

MutationResult MutationResult::error(MutationStatus status, TransactionId id,
                                     std::optional<Amount> amount, const std::string& message) {
  MutationResult result;
  result.status = status;
  result.transaction_id = id;
  result.amount = amount;
  result.message = message;
  return result;
}

}  // namespace payments
