#include "txproc/engine.h"

#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <vector>

#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>

#include "txproc/api.h"

using testing::HasSubstr;
using testing::Property;
using testing::Throws;
using txproc::Amount;
using txproc::ApplyError;
using txproc::Engine;
using txproc::EngineConfig;
using txproc::Report;
using txproc::SchedulerKind;
using txproc::Transaction;
using txproc::VectorTransactionSource;

namespace {
Amount Units(int64_t units) { return Amount::FromUnits(units); }

Report RunAll(Engine& engine, std::vector<Transaction> transactions) {
  VectorTransactionSource source(std::move(transactions));
  return engine.Run(source);
}

std::string Render(const Report& report) {
  std::ostringstream os;
  txproc::WriteReport(os, report);
  return os.str();
}
}  // namespace

TEST(EngineTest, EmptyInputGivesEmptyReport) {
  Engine engine({.thread_pool_size = 2});
  auto report = RunAll(engine, {});
  EXPECT_TRUE(report.accounts.empty());
  EXPECT_EQ(report.dispatch.routed, 0u);
  EXPECT_EQ(report.dispatch.accounts, 0u);
  EXPECT_EQ(Render(report), "client,available,held,total,locked\n");
}

TEST(EngineTest, EndToEndScenario) {
  Engine engine({.thread_pool_size = 4});
  auto report = RunAll(engine, {
                                   Transaction::Deposit(1, 1, Units(10)),
                                   Transaction::Deposit(2, 2, Units(2)),
                                   Transaction::Deposit(1, 3, Units(5)),
                                   Transaction::Withdrawal(1, 4, Units(20)),
                                   Transaction::Dispute(2, 2),
                                   Transaction::Chargeback(2, 2),
                                   Transaction::Deposit(2, 5, Units(1)),
                                   Transaction::Dispute(3, 999),
                               });
  EXPECT_EQ(Render(report),
            "client,available,held,total,locked\n"
            "1,15.0000,0.0000,15.0000,false\n"
            "2,0.0000,0.0000,0.0000,true\n"
            "3,0.0000,0.0000,0.0000,false\n");
  EXPECT_EQ(report.dispatch.routed, 8u);
  EXPECT_EQ(report.dispatch.accounts, 3u);
  EXPECT_EQ(report.TotalApplied(), 5u);
  EXPECT_EQ(report.TotalRejected(), 3u);
  EXPECT_EQ(report.RejectedCount(ApplyError::kInsufficientFunds), 1u);
  EXPECT_EQ(report.RejectedCount(ApplyError::kAccountLocked), 1u);
  EXPECT_EQ(report.RejectedCount(ApplyError::kUnknownTx), 1u);
}

TEST(EngineTest, SameClientTransactionsApplyInInputOrder) {
  // every withdrawal only succeeds if the deposit right before it already ran
  std::vector<Transaction> transactions;
  uint32_t tx_id = 0;
  for (int i = 0; i < 2000; ++i) {
    transactions.push_back(Transaction::Deposit(1, ++tx_id, Units(1)));
    transactions.push_back(Transaction::Withdrawal(1, ++tx_id, Units(1)));
  }
  for (size_t threads : {1, 2, 8}) {
    Engine engine({.thread_pool_size = threads, .dispatch_batch_size = 7});
    auto report = RunAll(engine, transactions);
    ASSERT_EQ(report.accounts.size(), 1u);
    EXPECT_EQ(report.accounts[0].stats.applied, 4000u) << "threads=" << threads;
    EXPECT_EQ(report.TotalRejected(), 0u);
    EXPECT_EQ(report.accounts[0].account.GetAvailable(), Amount());
  }
}

TEST(EngineTest, TwoClientsInterleavedSumUpForAnyPool) {
  std::vector<Transaction> transactions;
  uint32_t tx_id = 0;
  int64_t expected_1 = 0;
  int64_t expected_2 = 0;
  for (int i = 1; i <= 1000; ++i) {
    transactions.push_back(Transaction::Deposit(1, ++tx_id, Amount::FromRaw(i)));
    expected_1 += i;
    transactions.push_back(Transaction::Deposit(2, ++tx_id, Amount::FromRaw(2 * i)));
    expected_2 += 2 * i;
  }
  for (auto scheduler : {SchedulerKind::kWorkSharing, SchedulerKind::kWorkStealing}) {
    for (size_t threads : {1, 2, 4, 16}) {
      Engine engine({.thread_pool_size = threads, .scheduler = scheduler});
      auto report = RunAll(engine, transactions);
      ASSERT_EQ(report.accounts.size(), 2u);
      EXPECT_EQ(report.FindAccount(1)->account.GetAvailable(), Amount::FromRaw(expected_1))
          << scheduler << " threads=" << threads;
      EXPECT_EQ(report.FindAccount(2)->account.GetAvailable(), Amount::FromRaw(expected_2))
          << scheduler << " threads=" << threads;
    }
  }
}

TEST(EngineTest, EachAccountMatchesRunningItsSubsequenceAlone) {
  std::vector<Transaction> transactions;
  std::map<txproc::ClientId, std::vector<Transaction>> per_client;
  uint32_t tx_id = 0;
  for (int round = 0; round < 300; ++round) {
    for (txproc::ClientId client = 1; client <= 10; ++client) {
      ++tx_id;
      std::vector<Transaction> batch;
      switch ((round + client) % 6) {
        case 0:
        case 1:
          batch.push_back(Transaction::Deposit(client, tx_id, Amount::FromRaw(100 + round)));
          break;
        case 2:
          batch.push_back(Transaction::Withdrawal(client, tx_id, Amount::FromRaw(70)));
          break;
        case 3:
          batch.push_back(Transaction::Dispute(client, tx_id - 30));
          break;
        case 4:
          batch.push_back(Transaction::Resolve(client, tx_id - 40));
          break;
        default:
          batch.push_back(Transaction::Chargeback(client, tx_id - 50));
          break;
      }
      for (auto& tx : batch) {
        transactions.push_back(tx);
        per_client[client].push_back(tx);
      }
    }
  }

  Engine engine({.thread_pool_size = 4});
  auto report = RunAll(engine, transactions);
  ASSERT_EQ(report.accounts.size(), per_client.size());
  for (const auto& [client, client_transactions] : per_client) {
    txproc::Account alone(client);
    for (const auto& tx : client_transactions) {
      static_cast<void>(alone.Apply(tx));
    }
    const auto* closed = report.FindAccount(client);
    ASSERT_NE(closed, nullptr);
    EXPECT_EQ(closed->account.GetAvailable(), alone.GetAvailable()) << "client=" << client;
    EXPECT_EQ(closed->account.GetHeld(), alone.GetHeld()) << "client=" << client;
    EXPECT_EQ(closed->account.IsLocked(), alone.IsLocked()) << "client=" << client;
    closed->account.CheckInvariants();
  }
}

TEST(EngineTest, LockedAccountKeepsRejecting) {
  Engine engine({.thread_pool_size = 2});
  auto report = RunAll(engine, {
                                   Transaction::Deposit(1, 1, Units(10)),
                                   Transaction::Deposit(1, 2, Units(3)),
                                   Transaction::Dispute(1, 1),
                                   Transaction::Chargeback(1, 1),
                                   Transaction::Deposit(1, 3, Units(100)),
                                   Transaction::Withdrawal(1, 4, Units(1)),
                                   Transaction::Dispute(1, 2),
                               });
  const auto* closed = report.FindAccount(1);
  ASSERT_NE(closed, nullptr);
  EXPECT_TRUE(closed->account.IsLocked());
  EXPECT_EQ(closed->account.GetAvailable(), Units(3));
  EXPECT_EQ(closed->account.GetHeld(), Amount());
  EXPECT_EQ(closed->stats.Rejected(ApplyError::kAccountLocked), 3u);
}

TEST(EngineTest, AccountPolicyReachesAccounts) {
  std::vector<Transaction> transactions = {
      Transaction::Deposit(1, 1, Units(10)),
      Transaction::Withdrawal(1, 2, Units(4)),
      Transaction::Dispute(1, 2),
  };
  Engine strict({.thread_pool_size = 2});
  auto strict_report = RunAll(strict, transactions);
  EXPECT_EQ(strict_report.FindAccount(1)->account.GetHeld(), Amount());
  EXPECT_EQ(strict_report.RejectedCount(ApplyError::kInvalidDisputeState), 1u);

  Engine lenient({.thread_pool_size = 2, .account_policy = {.allow_withdrawal_disputes = true}});
  auto lenient_report = RunAll(lenient, transactions);
  EXPECT_EQ(lenient_report.FindAccount(1)->account.GetHeld(), Units(4));
  EXPECT_EQ(lenient_report.FindAccount(1)->account.GetAvailable(), Units(2));
}

TEST(EngineTest, EngineCanRunSeveralTimes) {
  Engine engine({.thread_pool_size = 3});
  for (int run = 0; run < 3; ++run) {
    auto report = RunAll(engine, {Transaction::Deposit(5, 1, Units(1)), Transaction::Deposit(6, 2, Units(2))});
    ASSERT_EQ(report.accounts.size(), 2u);
    // fresh actors per run, nothing carries over
    EXPECT_EQ(report.FindAccount(5)->account.GetTotal(), Units(1));
    EXPECT_EQ(report.FindAccount(6)->account.GetTotal(), Units(2));
  }
}

namespace {
class FailingSource : public txproc::TransactionSource {
 public:
  std::optional<Transaction> Next() override {
    if (served_ == 100) {
      throw std::runtime_error("disk on fire");
    }
    ++served_;
    return Transaction::Deposit(static_cast<txproc::ClientId>(served_ % 3), served_, Amount::FromRaw(1));
  }

 private:
  uint32_t served_ = 0;
};
}  // namespace

TEST(EngineTest, SourceFailureIsPropagatedAfterDraining) {
  Engine engine({.thread_pool_size = 2, .dispatch_batch_size = 16});
  FailingSource source;
  ASSERT_THAT([&engine, &source] { engine.Run(source); },
              Throws<std::exception>(Property(&std::exception::what, HasSubstr("disk on fire"))));

  // the engine is still usable afterwards
  auto report = RunAll(engine, {Transaction::Deposit(1, 1, Units(1))});
  EXPECT_EQ(report.accounts.size(), 1u);
}

TEST(EngineTest, RejectsInvalidConfig) {
  ASSERT_THAT([] { Engine engine({.thread_pool_size = 0}); },
              Throws<std::exception>(Property(&std::exception::what, HasSubstr("at least one worker"))));
  ASSERT_THAT([] { Engine engine({.thread_pool_size = 1, .dispatch_batch_size = 0}); },
              Throws<std::exception>(Property(&std::exception::what, HasSubstr("dispatch_batch_size"))));
}
