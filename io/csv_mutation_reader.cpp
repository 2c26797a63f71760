#include "io/csv_mutation_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <system_error>

namespace payments {
namespace io {

namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

template <typename T>
std::optional<T> parseUnsigned(const std::string& text) {
  if (text.empty()) return std::nullopt;
  unsigned long long value = 0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) return std::nullopt;
  if (value > std::numeric_limits<T>::max()) return std::nullopt;
  return static_cast<T>(value);
}

}  // namespace

CsvParseError::CsvParseError(std::size_t line, const std::string& message,
                             std::optional<TransactionId> transaction_id)
    : std::runtime_error("line " + std::to_string(line) +
                         (transaction_id ? ", transaction " + std::to_string(*transaction_id) : "") +
                         ": " + message),
      line_(line),
      transaction_id_(transaction_id) {}

CsvMutationReader::CsvMutationReader(std::istream& input) : input_(input) {}

std::vector<std::string> CsvMutationReader::splitFields(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  for (char c : line) {
    if (c == ',') {
      fields.push_back(trim(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  fields.push_back(trim(current));
  return fields;
}

std::string CsvMutationReader::trim(const std::string& text) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto first = std::find_if_not(text.begin(), text.end(), is_space);
  auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  if (first >= last) return "";
  return std::string(first, last);
}

bool CsvMutationReader::nextLine(std::string& line) {
  while (std::getline(input_, line)) {
    ++line_number_;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!trim(line).empty()) {
      return true;
    }
  }
  return false;
}

void CsvMutationReader::readHeader() {
  std::string line;
  header_read_ = true;
  if (!nextLine(line)) {
    return;
  }

  const auto columns = splitFields(line);
  for (std::size_t i = 0; i < columns.size(); ++i) {
    const std::string name = lowercase(columns[i]);
    if (name == "type") {
      type_column_ = i;
    } else if (name == "client") {
      client_column_ = i;
    } else if (name == "tx") {
      tx_column_ = i;
    } else if (name == "amount") {
      amount_column_ = i;
    }
  }

  if (!type_column_ || !client_column_ || !tx_column_) {
    header_error_.emplace(line_number_, "header must name the type, client and tx columns");
    throw *header_error_;
  }
}

std::optional<Mutation> CsvMutationReader::next() {
  if (header_error_) {
    throw *header_error_;
  }
  if (!header_read_) {
    readHeader();
  }

  std::string line;
  if (!nextLine(line)) {
    return std::nullopt;
  }
  return parseRow(splitFields(line));
}

std::string CsvMutationReader::fieldAt(const std::vector<std::string>& fields,
                                       std::optional<std::size_t> index) const {
  // A short row leaves its trailing fields empty.
  if (!index || *index >= fields.size()) {
    return "";
  }
  return fields[*index];
}

Mutation CsvMutationReader::parseRow(const std::vector<std::string>& fields) const {
  const std::string tx_text = fieldAt(fields, tx_column_);
  const auto tx = parseUnsigned<TransactionId>(tx_text);
  if (!tx) {
    throw CsvParseError(line_number_, "invalid transaction id '" + tx_text + "'");
  }

  const std::string type_text = fieldAt(fields, type_column_);
  const auto type = parseTransactionType(type_text);
  if (!type) {
    throw CsvParseError(line_number_, "unknown transaction type '" + type_text + "'", *tx);
  }

  const std::string client_text = fieldAt(fields, client_column_);
  const auto client = parseUnsigned<ClientId>(client_text);
  if (!client) {
    throw CsvParseError(line_number_, "invalid client id '" + client_text + "'", *tx);
  }

  Mutation mutation;
  mutation.id = *tx;
  mutation.type = *type;
  mutation.client_id = *client;

  const std::string amount_text = fieldAt(fields, amount_column_);
  if (carriesAmount(*type)) {
    if (amount_text.empty()) {
      throw CsvParseError(line_number_, transactionTypeName(*type) + " must have an amount", *tx);
    }
    const auto amount = parseAmount(amount_text);
    if (!amount) {
      throw CsvParseError(line_number_, "invalid amount '" + amount_text + "'", *tx);
    }
    mutation.amount = *amount;
  } else if (!amount_text.empty()) {
    throw CsvParseError(line_number_, transactionTypeName(*type) + " may not have an amount", *tx);
  }

  return mutation;
}

}  // namespace io
}  // namespace payments
