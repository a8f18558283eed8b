#include "txproc/account_actor.h"

#include <chrono>

#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>

#include "txproc/api.h"

namespace ex = txproc::ex;

using testing::HasSubstr;
using testing::Property;
using testing::Throws;
using txproc::AccountActor;
using txproc::Amount;
using txproc::ApplyError;
using txproc::Transaction;

TEST(AccountActorTest, CountsAppliedAndRejected) {
  AccountActor actor(1);
  actor.Apply(Transaction::Deposit(1, 1, Amount::FromUnits(10)));
  actor.Apply(Transaction::Withdrawal(1, 2, Amount::FromUnits(20)));
  actor.Apply(Transaction::Dispute(1, 99));
  actor.Apply(Transaction::Deposit(1, 1, Amount::FromUnits(10)));

  auto stats = actor.GetStats();
  EXPECT_EQ(stats.applied, 1u);
  EXPECT_EQ(stats.TotalRejected(), 3u);
  EXPECT_EQ(stats.Rejected(ApplyError::kInsufficientFunds), 1u);
  EXPECT_EQ(stats.Rejected(ApplyError::kUnknownTx), 1u);
  EXPECT_EQ(stats.Rejected(ApplyError::kDuplicateTxId), 1u);
  EXPECT_EQ(actor.Snapshot().GetAvailable(), Amount::FromUnits(10));
}

TEST(AccountActorTest, CloseYieldsAccountAndRefusesMoreWork) {
  AccountActor actor(4);
  actor.Apply(Transaction::Deposit(4, 1, Amount::FromUnits(3)));
  auto closed = actor.Close();
  EXPECT_EQ(closed.account.GetClientId(), 4);
  EXPECT_EQ(closed.account.GetTotal(), Amount::FromUnits(3));
  EXPECT_EQ(closed.stats.applied, 1u);

  ASSERT_THAT([&actor] { actor.Apply(Transaction::Deposit(4, 2, Amount::FromUnits(1))); },
              Throws<std::exception>(Property(&std::exception::what, HasSubstr("is closed"))));
  ASSERT_THAT([&actor] { actor.Close(); },
              Throws<std::exception>(Property(&std::exception::what, HasSubstr("already closed"))));
}

TEST(AccountActorTest, PolicyIsPassedToAccount) {
  AccountActor actor(1, {.policy = {.allow_withdrawal_disputes = true}});
  actor.Apply(Transaction::Deposit(1, 1, Amount::FromUnits(10)));
  actor.Apply(Transaction::Withdrawal(1, 2, Amount::FromUnits(4)));
  actor.Apply(Transaction::Dispute(1, 2));
  EXPECT_EQ(actor.Snapshot().GetHeld(), Amount::FromUnits(4));
  EXPECT_EQ(actor.GetStats().TotalRejected(), 0u);
}

TEST(AccountActorTest, CloseRunsAfterEveryQueuedTransaction) {
  txproc::WorkSharingThreadPool thread_pool(4);
  txproc::ActorRegistry registry(thread_pool.GetScheduler());
  auto actor = registry.CreateActor<AccountActor>(
      1, txproc::AccountActorOptions {.tx_delay = std::chrono::microseconds(10)});

  auto coroutine = [&actor]() -> exec::task<txproc::ClosedAccount> {
    exec::async_scope scope;
    for (uint32_t tx_id = 1; tx_id <= 500; ++tx_id) {
      scope.spawn(actor.Send<&AccountActor::Apply>(Transaction::Deposit(1, tx_id, Amount::FromRaw(1))));
    }
    // not awaiting the deposits, close must still see all of them
    auto closed = co_await actor.Send<&AccountActor::Close>();
    co_await scope.on_empty();
    co_return closed;
  };
  auto [closed] = ex::sync_wait(coroutine()).value();
  EXPECT_EQ(closed.account.GetAvailable(), Amount::FromRaw(500));
  EXPECT_EQ(closed.stats.applied, 500u);
}
