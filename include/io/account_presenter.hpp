#ifndef PAYMENTS_ACCOUNT_PRESENTER_HPP_
#define PAYMENTS_ACCOUNT_PRESENTER_HPP_

#include "core/account.hpp"
#include "core/account_registry.hpp"

#include <cstddef>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace payments {
namespace io {

// Column header of the account table.
extern const char* const kAccountCsvHeader;

// One CSV row: client,available,held,total,locked
std::string formatAccountRow(const Account& account);

/**
 * Writes the header and one row per account to `out`.
 * Returns the number of accounts written.
 */
std::size_t writeAccountsCsv(std::ostream& out, const AccountRegistry& accounts);

nlohmann::json accountToJson(const Account& account);
nlohmann::json accountsToJson(const AccountRegistry& accounts);

}  // namespace io
}  // namespace payments

#endif  // PAYMENTS_ACCOUNT_PRESENTER_HPP_
