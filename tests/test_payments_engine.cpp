#include "core/account_registry.hpp"
#include "payments_engine_impl.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <set>

using namespace payments;

namespace {

constexpr Amount kFive = 5 * kAmountScale;
constexpr Amount kSeven = 7 * kAmountScale;

}  // namespace

TEST(AccountRegistryTest, CreatesAccountsLazily) {
  AccountRegistry registry;
  EXPECT_TRUE(registry.empty());
  EXPECT_EQ(registry.find(3), nullptr);

  Account& account = registry.getOrCreate(3);
  EXPECT_EQ(account.clientId(), 3);
  EXPECT_EQ(account.total(), Amount{0});
  EXPECT_FALSE(account.locked());
  EXPECT_EQ(registry.size(), 1u);

  // Same instance on the second access
  EXPECT_EQ(&registry.getOrCreate(3), &account);
  EXPECT_EQ(registry.find(3), &account);
  EXPECT_EQ(registry.size(), 1u);
}

TEST(AccountRegistryTest, EnumeratesEveryAccount) {
  AccountRegistry registry;
  registry.getOrCreate(1);
  registry.getOrCreate(65535);
  registry.getOrCreate(42);

  std::set<ClientId> seen;
  for (const auto& [client_id, account] : registry) {
    EXPECT_EQ(client_id, account.clientId());
    seen.insert(client_id);
  }
  EXPECT_EQ(seen, (std::set<ClientId>{1, 42, 65535}));
}

// Test fixture for engine tests, used through the abstract interface
class PaymentsEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    engine_ = std::make_unique<PaymentsEngineImpl>();
  }

  Account account(ClientId client_id) {
    auto account = engine_->GetAccount(client_id);
    EXPECT_TRUE(account.has_value());
    return account.value_or(Account(client_id));
  }

  std::unique_ptr<PaymentsEngine> engine_;
};

TEST_F(PaymentsEngineTest, SingleDeposit) {
  EXPECT_TRUE(engine_->Apply(Mutation::deposit(1, 1, kFive)).ok());

  Account acc = account(1);
  EXPECT_EQ(acc.available(), kFive);
  EXPECT_EQ(acc.held(), Amount{0});
  EXPECT_EQ(acc.total(), kFive);
  EXPECT_FALSE(acc.locked());
}

TEST_F(PaymentsEngineTest, OverdrawnWithdrawalLeavesDepositState) {
  engine_->Apply(Mutation::deposit(1, 1, kFive));
  auto result = engine_->Apply(Mutation::withdrawal(2, 1, kSeven));
  EXPECT_EQ(result.status, MutationStatus::INSUFFICIENT_FUNDS);

  Account acc = account(1);
  EXPECT_EQ(acc.available(), kFive);
  EXPECT_EQ(acc.held(), Amount{0});
  EXPECT_EQ(acc.total(), kFive);
  EXPECT_FALSE(engine_->GetTransaction(2).has_value());
}

TEST_F(PaymentsEngineTest, FullDisputeLifecycle) {
  engine_->Apply(Mutation::deposit(1, 1, kFive));

  ASSERT_TRUE(engine_->Apply(Mutation::dispute(1, 1)).ok());
  Account acc = account(1);
  EXPECT_EQ(acc.available(), Amount{0});
  EXPECT_EQ(acc.held(), kFive);
  EXPECT_EQ(acc.total(), kFive);

  ASSERT_TRUE(engine_->Apply(Mutation::resolve(1, 1)).ok());
  acc = account(1);
  EXPECT_EQ(acc.available(), kFive);
  EXPECT_EQ(acc.held(), Amount{0});
  EXPECT_EQ(acc.total(), kFive);

  ASSERT_TRUE(engine_->Apply(Mutation::chargeback(1, 1)).ok());
  acc = account(1);
  EXPECT_EQ(acc.available(), Amount{0});
  EXPECT_EQ(acc.held(), Amount{0});
  EXPECT_EQ(acc.total(), Amount{0});
  EXPECT_TRUE(acc.locked());

  auto tx = engine_->GetTransaction(1);
  ASSERT_TRUE(tx.has_value());
  EXPECT_EQ(tx->status, TransactionStatus::REFUNDED);
}

TEST_F(PaymentsEngineTest, DisputeOfUnknownTransactionIsANoOp) {
  auto result = engine_->Apply(Mutation::dispute(99, 1));
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.status, MutationStatus::IGNORED);

  // The account is still created by the reference, with nothing in it
  Account acc = account(1);
  EXPECT_EQ(acc.total(), Amount{0});
  EXPECT_FALSE(acc.locked());
  EXPECT_EQ(engine_->TransactionCount(), 0u);
}

TEST_F(PaymentsEngineTest, RepeatedResolveAndChargebackAreIdempotent) {
  engine_->Apply(Mutation::deposit(1, 1, kSeven));
  engine_->Apply(Mutation::deposit(2, 1, kFive));
  engine_->Apply(Mutation::dispute(1, 1));
  engine_->Apply(Mutation::resolve(1, 1));

  Account before = account(1);
  EXPECT_EQ(engine_->Apply(Mutation::resolve(1, 1)).status, MutationStatus::IGNORED);
  Account after = account(1);
  EXPECT_EQ(after.available(), before.available());
  EXPECT_EQ(after.held(), before.held());
  EXPECT_EQ(after.total(), before.total());

  engine_->Apply(Mutation::chargeback(1, 1));
  before = account(1);
  // Second chargeback hits the locked account and changes nothing
  EXPECT_FALSE(engine_->Apply(Mutation::chargeback(1, 1)).ok());
  after = account(1);
  EXPECT_EQ(after.available(), before.available());
  EXPECT_EQ(after.held(), before.held());
  EXPECT_EQ(after.total(), before.total());
  EXPECT_EQ(after.total(), kFive);
}

TEST_F(PaymentsEngineTest, ClientsAreIndependent) {
  engine_->Apply(Mutation::deposit(1, 1, kFive));
  engine_->Apply(Mutation::deposit(2, 2, kSeven));
  engine_->Apply(Mutation::dispute(1, 1));
  engine_->Apply(Mutation::resolve(1, 1));
  engine_->Apply(Mutation::chargeback(1, 1));

  EXPECT_TRUE(account(1).locked());
  EXPECT_FALSE(account(2).locked());
  EXPECT_TRUE(engine_->Apply(Mutation::withdrawal(3, 2, kFive)).ok());
  EXPECT_EQ(account(2).available(), 2 * kAmountScale);

  EXPECT_EQ(engine_->Accounts().size(), 2u);
  EXPECT_EQ(engine_->TransactionCount(), 3u);
}

TEST_F(PaymentsEngineTest, UnknownClientHasNoAccount) {
  EXPECT_FALSE(engine_->GetAccount(7).has_value());
  EXPECT_FALSE(engine_->GetTransaction(7).has_value());
}
