#include "processing/transaction_processor.hpp"

#include "observability/logger.hpp"

#include <chrono>
#include <utility>

namespace payments {
namespace processing {

namespace {

const char* const kMutationsTotal = "payments_mutations_total";
const char* const kMutationsIgnored = "payments_mutations_ignored_total";
const char* const kMutationsRejected = "payments_mutations_rejected_total";
const char* const kParseErrors = "payments_parse_errors_total";
const char* const kAccountsGauge = "payments_accounts";
const char* const kLedgerGauge = "payments_ledger_entries";
const char* const kMutationDuration = "payments_mutation_duration_seconds";

}  // namespace

TransactionProcessor::TransactionProcessor(PaymentsEngine* engine,
                                           config::ErrorPolicy policy,
                                           observability::MetricsCollector* metrics)
    : engine_(engine), policy_(policy), metrics_(metrics) {
  metrics_->describe(kMutationsTotal, "Mutations handed to the engine");
  metrics_->describe(kMutationsIgnored, "Dispute-family records that referenced no eligible transaction");
  metrics_->describe(kMutationsRejected, "Mutations rejected by the engine");
  metrics_->describe(kParseErrors, "Input rows that failed validation");
  metrics_->describe(kAccountsGauge, "Known client accounts");
  metrics_->describe(kLedgerGauge, "Deposits and withdrawals recorded");
  metrics_->describe(kMutationDuration, "Time spent applying one mutation");
}

void TransactionProcessor::setResultCallback(ResultCallback callback) {
  callback_ = std::move(callback);
}

bool TransactionProcessor::processAll(io::CsvMutationReader& reader) {
  while (true) {
    std::optional<Mutation> mutation;
    try {
      mutation = reader.next();
    } catch (const io::CsvHeaderError& e) {
      handleHeaderError(e);
      publishGauges();
      return false;
    } catch (const io::CsvParseError& e) {
      if (handleParseError(e)) continue;
      publishGauges();
      return false;
    }

    if (!mutation.has_value()) {
      break;
    }

    const MutationResult result = process(*mutation);
    if (!result.ok() && !handleRejection(*mutation, result)) {
      publishGauges();
      return false;
    }
  }

  publishGauges();
  LOG_BUILDER(observability::LogLevel::INFO, "Input consumed")
      .field("applied", static_cast<std::uint64_t>(mutations_applied_))
      .field("ignored", static_cast<std::uint64_t>(mutations_ignored_))
      .field("rejected", static_cast<std::uint64_t>(mutations_rejected_))
      .field("parse_errors", static_cast<std::uint64_t>(parse_errors_));
  return true;
}

MutationResult TransactionProcessor::process(const Mutation& mutation) {
  auto start_time = std::chrono::steady_clock::now();
  MutationResult result;
  {
    observability::MetricsCollector::Timer timer(*metrics_, kMutationDuration);
    result = engine_->Apply(mutation);
  }
  auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start_time);
  total_processing_time_us_ += static_cast<std::uint64_t>(duration.count());

  metrics_->incrementCounter(kMutationsTotal);
  switch (result.status) {
    case MutationStatus::SUCCESS:
      ++mutations_applied_;
      break;
    case MutationStatus::IGNORED:
      ++mutations_ignored_;
      metrics_->incrementCounter(kMutationsIgnored);
      if (observability::Logger::getInstance().isEnabled(observability::LogLevel::DEBUG)) {
        LOG_BUILDER(observability::LogLevel::DEBUG, "Ignored record")
            .field("tx", static_cast<std::uint64_t>(mutation.id))
            .field("client", static_cast<int>(mutation.client_id))
            .field("type", transactionTypeName(mutation.type))
            .field("reason", result.message);
      }
      break;
    default:
      ++mutations_rejected_;
      metrics_->incrementCounter(kMutationsRejected);
      break;
  }

  if (callback_) {
    callback_(mutation, result);
  }
  return result;
}

bool TransactionProcessor::handleRejection(const Mutation& mutation, const MutationResult& result) {
  const bool abort = policy_ == config::ErrorPolicy::ABORT;
  {
    auto entry = LOG_BUILDER(abort ? observability::LogLevel::ERROR : observability::LogLevel::WARN,
                             abort ? "Transaction rejected, aborting" : "Transaction rejected, skipping");
    entry.field("tx", static_cast<std::uint64_t>(result.transaction_id))
        .field("client", static_cast<int>(mutation.client_id))
        .field("type", transactionTypeName(mutation.type))
        .field("status", mutationStatusName(result.status))
        .field("reason", result.message);
    if (result.amount) {
      entry.field("amount", formatAmount(*result.amount));
    }
  }

  if (abort) {
    failure_ = "Error on transaction " + std::to_string(result.transaction_id) + " (" +
               mutationStatusName(result.status) + "): " + result.message;
  }
  return !abort;
}

bool TransactionProcessor::handleParseError(const io::CsvParseError& error) {
  ++parse_errors_;
  metrics_->incrementCounter(kParseErrors);

  const bool abort = policy_ == config::ErrorPolicy::ABORT;
  LOG_BUILDER(abort ? observability::LogLevel::ERROR : observability::LogLevel::WARN,
              abort ? "Malformed input row, aborting" : "Malformed input row, skipping")
      .field("line", static_cast<std::uint64_t>(error.line()))
      .field("reason", error.what());

  if (abort) {
    failure_ = std::string("Error parsing input, ") + error.what();
  }
  return !abort;
}

void TransactionProcessor::handleHeaderError(const io::CsvHeaderError& error) {
  ++parse_errors_;
  metrics_->incrementCounter(kParseErrors);

  // Fatal under every policy: skipping would drop every row.
  LOG_BUILDER(observability::LogLevel::ERROR, "Unreadable input header, aborting")
      .field("line", static_cast<std::uint64_t>(error.line()))
      .field("reason", error.what());
  failure_ = std::string("Error parsing input header, ") + error.what();
}

void TransactionProcessor::publishGauges() {
  metrics_->setGauge(kAccountsGauge, static_cast<double>(engine_->Accounts().size()));
  metrics_->setGauge(kLedgerGauge, static_cast<double>(engine_->TransactionCount()));
}

TransactionProcessor::Stats TransactionProcessor::getStats() const {
  Stats stats;
  stats.mutations_applied = mutations_applied_;
  stats.mutations_ignored = mutations_ignored_;
  stats.mutations_rejected = mutations_rejected_;
  stats.parse_errors = parse_errors_;

  const std::size_t processed = mutations_applied_ + mutations_ignored_ + mutations_rejected_;
  if (processed > 0) {
    stats.avg_processing_time_us = static_cast<double>(total_processing_time_us_) / processed;
  }
  return stats;
}

}  // namespace processing
}  // namespace payments
