#include "observability/logger.hpp"
#include "payments_engine_impl.hpp"
#include "processing/transaction_processor.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <iostream>

#include <memory>
#include <sstream>
#include <vector>

using namespace payments;
using payments::config::ErrorPolicy;
using payments::processing::TransactionProcessor;

// Test fixture: fresh engine and metrics per test
class TransactionProcessorTest : public ::testing::Test {
 protected:
  bool run(const std::string& csv, ErrorPolicy policy) {
    std::istringstream input(csv);
    io::CsvMutationReader reader(input);
    processor_ = std::make_unique<TransactionProcessor>(&engine_, policy, &metrics_);
    return processor_->processAll(reader);
  }

  Amount available(ClientId client_id) const {
    auto account = engine_.GetAccount(client_id);
    return account ? account->available() : 0;
  }

  PaymentsEngineImpl engine_;
  observability::MetricsCollector metrics_;
  std::unique_ptr<TransactionProcessor> processor_;
};

TEST_F(TransactionProcessorTest, ProcessesWholeInput) {
  const bool ok = run(
      "type,client,tx,amount\n"
      "deposit,1,1,1.0\n"
      "deposit,2,2,2.0\n"
      "deposit,1,3,2.0\n"
      "withdrawal,1,4,1.5\n"
      "withdrawal,2,5,3.0\n",
      ErrorPolicy::SKIP);
  EXPECT_TRUE(ok);
  EXPECT_EQ(available(1), Amount{15000});
  EXPECT_EQ(available(2), Amount{20000});

  auto stats = processor_->getStats();
  EXPECT_EQ(stats.mutations_applied, 4u);
  EXPECT_EQ(stats.mutations_rejected, 1u);
  EXPECT_EQ(stats.mutations_ignored, 0u);
  EXPECT_EQ(stats.parse_errors, 0u);
  EXPECT_FALSE(processor_->failure().has_value());
}

TEST_F(TransactionProcessorTest, AbortStopsAtFirstRejectedRecord) {
  const bool ok = run(
      "type,client,tx,amount\n"
      "deposit,1,1,5.0\n"
      "withdrawal,1,2,7.0\n"
      "deposit,1,3,1.0\n",
      ErrorPolicy::ABORT);
  EXPECT_FALSE(ok);
  EXPECT_EQ(available(1), Amount{50000});
  EXPECT_EQ(engine_.TransactionCount(), 1u);

  ASSERT_TRUE(processor_->failure().has_value());
  EXPECT_NE(processor_->failure()->find("transaction 2"), std::string::npos);
  EXPECT_NE(processor_->failure()->find("INSUFFICIENT_FUNDS"), std::string::npos);
}

TEST_F(TransactionProcessorTest, AbortStopsAtMalformedRow) {
  const bool ok = run(
      "type,client,tx,amount\n"
      "deposit,1,1,5.0\n"
      "dispute,1,1,5.0\n"
      "deposit,1,2,1.0\n",
      ErrorPolicy::ABORT);
  EXPECT_FALSE(ok);
  EXPECT_EQ(available(1), Amount{50000});
  EXPECT_EQ(processor_->getStats().parse_errors, 1u);
  ASSERT_TRUE(processor_->failure().has_value());
  EXPECT_NE(processor_->failure()->find("line 3"), std::string::npos);
}

TEST_F(TransactionProcessorTest, SkipContinuesPastBadRecords) {
  const bool ok = run(
      "type,client,tx,amount\n"
      "deposit,1,1,5.0\n"
      "dispute,1,1,5.0\n"
      "withdrawal,1,2,7.0\n"
      "dispute,1,77,\n"
      "deposit,1,3,1.0\n",
      ErrorPolicy::SKIP);
  EXPECT_TRUE(ok);
  EXPECT_EQ(available(1), Amount{60000});

  auto stats = processor_->getStats();
  EXPECT_EQ(stats.mutations_applied, 2u);
  EXPECT_EQ(stats.mutations_ignored, 1u);
  EXPECT_EQ(stats.mutations_rejected, 1u);
  EXPECT_EQ(stats.parse_errors, 1u);
}

TEST_F(TransactionProcessorTest, IgnoredRecordsDoNotAbort) {
  const bool ok = run(
      "type,client,tx,amount\n"
      "deposit,1,1,5.0\n"
      "resolve,1,1,\n"
      "chargeback,1,1,\n"
      "dispute,1,99,\n",
      ErrorPolicy::ABORT);
  EXPECT_TRUE(ok);
  EXPECT_EQ(processor_->getStats().mutations_ignored, 3u);
}

TEST_F(TransactionProcessorTest, OrderingChangesOutcome) {
  EXPECT_FALSE(run(
      "type,client,tx,amount\n"
      "deposit,1,1,5.0\n"
      "dispute,1,1,\n"
      "withdrawal,1,2,5.0\n",
      ErrorPolicy::ABORT));

  PaymentsEngineImpl other;
  observability::MetricsCollector other_metrics;
  TransactionProcessor processor(&other, ErrorPolicy::ABORT, &other_metrics);
  std::istringstream input(
      "type,client,tx,amount\n"
      "deposit,1,1,5.0\n"
      "withdrawal,1,2,5.0\n");
  io::CsvMutationReader reader(input);
  EXPECT_TRUE(processor.processAll(reader));
  EXPECT_EQ(other.GetAccount(1)->total(), Amount{0});
}

TEST_F(TransactionProcessorTest, RecordsMetrics) {
  run("type,client,tx,amount\n"
      "deposit,1,1,5.0\n"
      "deposit,2,2,5.0\n"
      "dispute,1,9,\n"
      "withdrawal,2,3,9.0\n"
      "resolve,1,1,1.0\n",
      ErrorPolicy::SKIP);

  EXPECT_EQ(metrics_.counterValue("payments_mutations_total"), 4.0);
  EXPECT_EQ(metrics_.counterValue("payments_mutations_ignored_total"), 1.0);
  EXPECT_EQ(metrics_.counterValue("payments_mutations_rejected_total"), 1.0);
  EXPECT_EQ(metrics_.counterValue("payments_parse_errors_total"), 1.0);
  EXPECT_EQ(metrics_.gaugeValue("payments_accounts"), 2.0);
  EXPECT_EQ(metrics_.gaugeValue("payments_ledger_entries"), 2.0);
  EXPECT_EQ(metrics_.histogramCount("payments_mutation_duration_seconds"), 4u);
}

TEST_F(TransactionProcessorTest, CallbackSeesEveryResult) {
  TransactionProcessor processor(&engine_, ErrorPolicy::SKIP, &metrics_);
  std::vector<MutationStatus> statuses;
  processor.setResultCallback([&statuses](const Mutation&, const MutationResult& result) {
    statuses.push_back(result.status);
  });

  processor.process(Mutation::deposit(1, 1, 100));
  processor.process(Mutation::withdrawal(2, 1, 200));
  processor.process(Mutation::resolve(1, 1));

  ASSERT_EQ(statuses.size(), 3u);
  EXPECT_EQ(statuses[0], MutationStatus::SUCCESS);
  EXPECT_EQ(statuses[1], MutationStatus::INSUFFICIENT_FUNDS);
  EXPECT_EQ(statuses[2], MutationStatus::IGNORED);
}

TEST_F(TransactionProcessorTest, BadHeaderIsFatalEvenWhenSkipping) {
  const bool ok = run(
      "kind,client,tx,amount\n"
      "deposit,1,1,5.0\n"
      "deposit,2,2,1.0\n",
      ErrorPolicy::SKIP);
  EXPECT_FALSE(ok);
  ASSERT_TRUE(processor_->failure().has_value());
  EXPECT_NE(processor_->failure()->find("header"), std::string::npos);
  EXPECT_TRUE(engine_.Accounts().empty());

  auto stats = processor_->getStats();
  EXPECT_EQ(stats.parse_errors, 1u);
  EXPECT_EQ(stats.mutations_applied, 0u);
  EXPECT_EQ(metrics_.counterValue("payments_parse_errors_total"), 1.0);
}

TEST_F(TransactionProcessorTest, DisputeOfAnotherClientsDepositAborts) {
  const bool ok = run(
      "type,client,tx,amount\n"
      "deposit,1,1,5.0\n"
      "deposit,2,2,1.0\n"
      "dispute,2,1,\n",
      ErrorPolicy::ABORT);
  EXPECT_FALSE(ok);
  ASSERT_TRUE(processor_->failure().has_value());
  EXPECT_NE(processor_->failure()->find("ARITHMETIC_ERROR"), std::string::npos);
  EXPECT_EQ(available(1), Amount{50000});
  EXPECT_EQ(available(2), Amount{10000});
  EXPECT_EQ(processor_->getStats().mutations_ignored, 0u);
}

// Same as TransactionProcessorTest, with the logger enabled and captured
class TransactionProcessorLoggingTest : public TransactionProcessorTest {
 protected:
  void SetUp() override {
    previous_level_ = observability::Logger::getInstance().getLogLevel();
    observability::Logger::getInstance().setOutputStream(log_);
    observability::Logger::getInstance().setLogLevel(observability::LogLevel::DEBUG);
  }

  void TearDown() override {
    observability::Logger::getInstance().setOutputStream(std::cerr);
    observability::Logger::getInstance().setLogLevel(previous_level_);
  }

  std::vector<nlohmann::json> logLines() const {
    std::istringstream lines(log_.str());
    std::vector<nlohmann::json> parsed;
    std::string line;
    while (std::getline(lines, line)) {
      if (!line.empty()) parsed.push_back(nlohmann::json::parse(line));
    }
    return parsed;
  }

  std::ostringstream log_;
  observability::LogLevel previous_level_ = observability::LogLevel::INFO;
};

TEST_F(TransactionProcessorLoggingTest, InvalidUtf8RowIsReportedNotFatal) {
  bool ok = true;
  EXPECT_NO_THROW(ok = run(
      "type,client,tx,amount\n"
      "deposit,1,1,5.0\n"
      "dep\xffosit,1,2,1.0\n",
      ErrorPolicy::ABORT));
  EXPECT_FALSE(ok);
  ASSERT_TRUE(processor_->failure().has_value());
  EXPECT_EQ(available(1), Amount{50000});

  std::vector<nlohmann::json> lines;
  ASSERT_NO_THROW(lines = logLines());
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(lines.back()["level"], "ERROR");
  EXPECT_EQ(lines.back()["line"], 3);
  EXPECT_NE(lines.back()["reason"].get<std::string>().find("dep\xEF\xBF\xBDosit"),
            std::string::npos);
}

TEST_F(TransactionProcessorLoggingTest, InvalidUtf8RowIsSkipped) {
  const bool ok = run(
      "type,client,tx,amount\n"
      "dep\xffosit,1,1,1.0\n"
      "deposit,1,2,2.0\n",
      ErrorPolicy::SKIP);
  EXPECT_TRUE(ok);
  EXPECT_EQ(available(1), Amount{20000});
  EXPECT_EQ(processor_->getStats().parse_errors, 1u);
  EXPECT_NO_THROW(logLines());
}
