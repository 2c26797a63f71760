#ifndef PAYMENTS_CSV_MUTATION_READER_HPP_
#define PAYMENTS_CSV_MUTATION_READER_HPP_

#include "core/mutation.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace payments {
namespace io {

/**
 * Raised for rows that cannot become a valid Mutation.
 */
class CsvParseError : public std::runtime_error {
 public:
  CsvParseError(std::size_t line, const std::string& message,
                std::optional<TransactionId> transaction_id = std::nullopt);

  std::size_t line() const { return line_; }
  std::optional<TransactionId> transactionId() const { return transaction_id_; }

 private:
  std::size_t line_;
  std::optional<TransactionId> transaction_id_;
};

// The header does not name the required columns. No row of the input can be
// read after this, so the error is never skippable.
class CsvHeaderError : public CsvParseError {
 public:
  CsvHeaderError(std::size_t line, const std::string& message)
      : CsvParseError(line, message) {}
};

/**
 * Lazily reads mutations from CSV text with a `type,client,tx,amount` header.
 *
 * Columns may appear in any order and the amount column may be omitted.
 * Fields are trimmed and blank lines are skipped. Each row is validated
 * before it is returned: the amount must be present for deposits and
 * withdrawals and absent for disputes, resolves and chargebacks.
 */
class CsvMutationReader {
 public:
  explicit CsvMutationReader(std::istream& input);

  // Non-copyable
  CsvMutationReader(const CsvMutationReader&) = delete;
  CsvMutationReader& operator=(const CsvMutationReader&) = delete;

  /**
   * Returns the next mutation, or nullopt once the input is exhausted.
   * Throws CsvParseError on a malformed row; the reader can keep going with
   * the following row afterwards. Throws CsvHeaderError on a malformed header,
   * and again on every later call.
   */
  std::optional<Mutation> next();

  // Line number of the row most recently read (1-based).
  std::size_t lineNumber() const { return line_number_; }

  static std::vector<std::string> splitFields(const std::string& line);
  static std::string trim(const std::string& text);

 private:
  void readHeader();
  Mutation parseRow(const std::vector<std::string>& fields) const;
  std::string fieldAt(const std::vector<std::string>& fields,
                      std::optional<std::size_t> index) const;
  bool nextLine(std::string& line);

  std::istream& input_;
  std::size_t line_number_ = 0;
  bool header_read_ = false;
  std::optional<CsvHeaderError> header_error_;

  std::optional<std::size_t> type_column_;
  std::optional<std::size_t> client_column_;
  std::optional<std::size_t> tx_column_;
  std::optional<std::size_t> amount_column_;
};

}  // namespace io
}  // namespace payments

#endif  // PAYMENTS_CSV_MUTATION_READER_HPP_
