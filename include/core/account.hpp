#ifndef PAYMENTS_ACCOUNT_HPP_
#define PAYMENTS_ACCOUNT_HPP_

#include "core/amount.hpp"
#include "core/ledger.hpp"
#include "core/mutation.hpp"

namespace payments {

/**
 * Balance state of a single client and the rules for changing it.
 *
 * Invariant: total() == available() + held() after every call to mutate().
 * A chargeback locks the account; a locked account rejects every further
 * mutation.
 */
class Account {
 public:
  explicit Account(ClientId client_id);

  ClientId clientId() const { return client_id_; }
  Amount available() const { return available_; }
  Amount held() const { return held_; }
  Amount total() const { return total_; }
  bool locked() const { return locked_; }

  bool isConsistent() const;

  /**
   * Applies one mutation, recording deposits and withdrawals in `ledger` and
   * resolving dispute-family records against it. Entries are looked up by
   * transaction id alone; a dispute-family record moves the balances of this
   * account whichever client recorded the entry.
   *
   * Records that refer to unknown transactions, or to transactions that are
   * not in the expected stage, are ignored. Any other failure leaves both the
   * account and the ledger untouched.
   */
  MutationResult mutate(const Mutation& mutation, Ledger& ledger);

 private:
  MutationResult processDeposit(const Mutation& mutation, Ledger& ledger);
  MutationResult processWithdrawal(const Mutation& mutation, Ledger& ledger);
  MutationResult processDispute(TransactionId id, Ledger& ledger);
  MutationResult processResolve(TransactionId id, Ledger& ledger);
  MutationResult processChargeback(TransactionId id, Ledger& ledger);

  ClientId client_id_;
  Amount available_ = 0;
  Amount held_ = 0;
  Amount total_ = 0;
  bool locked_ = false;
};

}  // namespace payments

#endif  // PAYMENTS_ACCOUNT_HPP_
