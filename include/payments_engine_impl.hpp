#ifndef PAYMENTS_ENGINE_IMPL_HPP_
#define PAYMENTS_ENGINE_IMPL_HPP_

#include "payments_engine.hpp"

namespace payments {

// In-memory engine: one account registry and one ledger, owned for the whole
// run. Not thread-safe; a single caller applies mutations in order.
class PaymentsEngineImpl : public PaymentsEngine {
 public:
  PaymentsEngineImpl() = default;

  MutationResult Apply(const Mutation& mutation) override;
  std::optional<Account> GetAccount(ClientId client_id) const override;
  std::optional<LedgerEntry> GetTransaction(TransactionId id) const override;
  const AccountRegistry& Accounts() const override;
  std::size_t TransactionCount() const override;

 private:
  AccountRegistry accounts_;
  // Shared by all accounts; passed into each mutation.
  Ledger ledger_;
};

}  // namespace payments

#endif  // PAYMENTS_ENGINE_IMPL_HPP_
