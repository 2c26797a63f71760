#include "io/account_presenter.hpp"

#include "observability/logger.hpp"

namespace payments {
namespace io {

const char* const kAccountCsvHeader = "client,available,held,total,locked";

std::string formatAccountRow(const Account& account) {
  return std::to_string(account.clientId()) + "," +
         formatAmount(account.available()) + "," +
         formatAmount(account.held()) + "," +
         formatAmount(account.total()) + "," +
         (account.locked() ? "true" : "false");
}

std::size_t writeAccountsCsv(std::ostream& out, const AccountRegistry& accounts) {
  out << kAccountCsvHeader << '\n';
  std::size_t written = 0;
  for (const auto& [client_id, account] : accounts) {
    if (!account.isConsistent()) {
      LOG_BUILDER(observability::LogLevel::ERROR, "Account balances are inconsistent")
          .field("client", static_cast<int>(client_id))
          .field("available", formatAmount(account.available()))
          .field("held", formatAmount(account.held()))
          .field("total", formatAmount(account.total()));
    }
    out << formatAccountRow(account) << '\n';
    ++written;
  }
  out.flush();
  return written;
}

nlohmann::json accountToJson(const Account& account) {
  nlohmann::json j;
  j["client"] = account.clientId();
  j["available"] = formatAmount(account.available());
  j["held"] = formatAmount(account.held());
  j["total"] = formatAmount(account.total());
  j["locked"] = account.locked();
  return j;
}

nlohmann::json accountsToJson(const AccountRegistry& accounts) {
  nlohmann::json result = nlohmann::json::array();
  for (const auto& entry : accounts) {
    result.push_back(accountToJson(entry.second));
  }
  return result;
}

}  // namespace io
}  // namespace payments
