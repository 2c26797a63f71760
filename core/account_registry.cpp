#include "core/account_registry.hpp"

namespace payments {

Account& AccountRegistry::getOrCreate(ClientId client_id) {
  auto it = accounts_.find(client_id);
  if (it == accounts_.end()) {
    it = accounts_.emplace(client_id, Account(client_id)).first;
  }
  return it->second;
}

const Account* AccountRegistry::find(ClientId client_id) const {
  auto it = accounts_.find(client_id);
  return it == accounts_.end() ? nullptr : &it->second;
}

}  // namespace payments
