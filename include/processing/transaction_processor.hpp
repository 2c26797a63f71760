#ifndef PAYMENTS_TRANSACTION_PROCESSOR_HPP_
#define PAYMENTS_TRANSACTION_PROCESSOR_HPP_

#include "config/engine_config.hpp"
#include "io/csv_mutation_reader.hpp"
#include "observability/metrics.hpp"
#include "payments_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace payments {
namespace processing {

/**
 * Drives an ordered stream of mutations through a PaymentsEngine.
 *
 * Records are applied strictly one after another in input order. The error
 * policy decides whether a rejected or malformed record ends the run.
 */
class TransactionProcessor {
 public:
  using ResultCallback = std::function<void(const Mutation&, const MutationResult&)>;

  TransactionProcessor(PaymentsEngine* engine,
                       config::ErrorPolicy policy = config::ErrorPolicy::ABORT,
                       observability::MetricsCollector* metrics = &observability::getGlobalMetrics());

  // Non-copyable
  TransactionProcessor(const TransactionProcessor&) = delete;
  TransactionProcessor& operator=(const TransactionProcessor&) = delete;

  /**
   * Consumes `reader` until it is exhausted or, under ABORT, until the first
   * failure. A malformed header stops the run under either policy. Returns true if every record was consumed without an
   * unrecoverable error.
   */
  bool processAll(io::CsvMutationReader& reader);

  /**
   * Applies a single mutation and updates statistics and metrics.
   */
  MutationResult process(const Mutation& mutation);

  void setResultCallback(ResultCallback callback);

  /**
   * Diagnostic for the failure that stopped the run, if any.
   */
  const std::optional<std::string>& failure() const { return failure_; }

  struct Stats {
    std::size_t mutations_applied = 0;
    std::size_t mutations_ignored = 0;
    std::size_t mutations_rejected = 0;
    std::size_t parse_errors = 0;
    double avg_processing_time_us = 0.0;
  };
  Stats getStats() const;

 private:
  // Returns true if processing should continue.
  bool handleRejection(const Mutation& mutation, const MutationResult& result);
  bool handleParseError(const io::CsvParseError& error);
  void handleHeaderError(const io::CsvHeaderError& error);
  void publishGauges();

  PaymentsEngine* engine_;
  config::ErrorPolicy policy_;
  observability::MetricsCollector* metrics_;
  ResultCallback callback_;
  std::optional<std::string> failure_;

  // Statistics
  std::size_t mutations_applied_ = 0;
  std::size_t mutations_ignored_ = 0;
  std::size_t mutations_rejected_ = 0;
  std::size_t parse_errors_ = 0;
  std::uint64_t total_processing_time_us_ = 0;
};

}  // namespace processing
}  // namespace payments

#endif  // PAYMENTS_TRANSACTION_PROCESSOR_HPP_
