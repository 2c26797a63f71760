#ifndef PAYMENTS_ENGINE_HPP_
#define PAYMENTS_ENGINE_HPP_

#include "core/account.hpp"
#include "core/account_registry.hpp"
#include "core/ledger.hpp"
#include "core/mutation.hpp"

#include <cstddef>
#include <optional>

namespace payments {

/**
 * Abstract base class for the transaction engine.
 * Mutations must be applied in the order they were received.
 */
class PaymentsEngine {
 public:
  virtual ~PaymentsEngine() = default;

  /**
   * Applies `mutation` to the account of its client, creating the account if
   * this is the first time the client is seen.
   */
  virtual MutationResult Apply(const Mutation& mutation) = 0;

  /**
   * Returns a copy of the account state, or nullopt for an unknown client.
   */
  virtual std::optional<Account> GetAccount(ClientId client_id) const = 0;

  /**
   * Returns the stored deposit or withdrawal with the given id.
   */
  virtual std::optional<LedgerEntry> GetTransaction(TransactionId id) const = 0;

  /**
   * All accounts seen so far, in unspecified order.
   */
  virtual const AccountRegistry& Accounts() const = 0;

  /**
   * Number of deposits and withdrawals recorded.
   */
  virtual std::size_t TransactionCount() const = 0;
};

}  // namespace payments

#endif  // PAYMENTS_ENGINE_HPP_
