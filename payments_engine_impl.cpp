#include "payments_engine_impl.hpp"

namespace payments {

MutationResult PaymentsEngineImpl::Apply(const Mutation& mutation) {
  return accounts_.getOrCreate(mutation.client_id).mutate(mutation, ledger_);
}

std::optional<Account> PaymentsEngineImpl::GetAccount(ClientId client_id) const {
  const Account* account = accounts_.find(client_id);
  if (account == nullptr) {
    return std::nullopt;
  }
  return *account;
}

std::optional<LedgerEntry> PaymentsEngineImpl::GetTransaction(TransactionId id) const {
  const LedgerEntry* entry = ledger_.find(id);
  if (entry == nullptr) {
    return std::nullopt;
  }
  return *entry;
}

const AccountRegistry& PaymentsEngineImpl::Accounts() const {
  return accounts_;
}

std::size_t PaymentsEngineImpl::TransactionCount() const {
  return ledger_.size();
}

}  // namespace payments
