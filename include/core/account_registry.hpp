#ifndef PAYMENTS_ACCOUNT_REGISTRY_HPP_
#define PAYMENTS_ACCOUNT_REGISTRY_HPP_

#include "core/account.hpp"

#include <cstddef>
#include <unordered_map>

namespace payments {

/**
 * Maps client ids to accounts. Accounts are created on first reference and
 * never removed. Iteration order is unspecified.
 */
class AccountRegistry {
 public:
  using Map = std::unordered_map<ClientId, Account>;
  using const_iterator = Map::const_iterator;

  AccountRegistry() = default;

  // Non-copyable
  AccountRegistry(const AccountRegistry&) = delete;
  AccountRegistry& operator=(const AccountRegistry&) = delete;

  // Returns the account for `client_id`, inserting an empty one if needed.
  Account& getOrCreate(ClientId client_id);

  // nullptr if the client has never been referenced.
  const Account* find(ClientId client_id) const;

  std::size_t size() const { return accounts_.size(); }
  bool empty() const { return accounts_.empty(); }

  const_iterator begin() const { return accounts_.begin(); }
  const_iterator end() const { return accounts_.end(); }

 private:
  Map accounts_;
};

}  // namespace payments

#endif  // PAYMENTS_ACCOUNT_REGISTRY_HPP_
