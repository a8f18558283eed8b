#include "txproc/report.h"

#include <sstream>

#include <gtest/gtest.h>

using txproc::Account;
using txproc::AccountActorStats;
using txproc::Amount;
using txproc::ApplyError;
using txproc::ClosedAccount;
using txproc::Report;
using txproc::Transaction;

namespace {
ClosedAccount MakeClosed(txproc::ClientId client_id, std::initializer_list<Transaction> transactions) {
  Account account(client_id);
  AccountActorStats stats;
  for (const auto& tx : transactions) {
    if (auto error = account.Apply(tx)) {
      stats.rejected.at(static_cast<size_t>(*error))++;
    } else {
      stats.applied++;
    }
  }
  return ClosedAccount {.account = account, .stats = stats};
}
}  // namespace

TEST(ReportTest, WritesHeaderAndFourDecimalRows) {
  Report report;
  report.accounts.push_back(MakeClosed(1, {Transaction::Deposit(1, 1, *Amount::Parse("1.5")),
                                           Transaction::Deposit(1, 2, *Amount::Parse("0.0001"))}));
  report.accounts.push_back(MakeClosed(2, {Transaction::Deposit(2, 3, Amount::FromUnits(2)), Transaction::Dispute(2, 3),
                                           Transaction::Chargeback(2, 3)}));
  report.accounts.push_back(MakeClosed(3, {Transaction::Deposit(3, 4, Amount::FromUnits(9)), Transaction::Dispute(3, 4)}));

  std::ostringstream os;
  txproc::WriteReport(os, report);
  EXPECT_EQ(os.str(),
            "client,available,held,total,locked\n"
            "1,1.5001,0.0000,1.5001,false\n"
            "2,0.0000,0.0000,0.0000,true\n"
            "3,0.0000,9.0000,9.0000,false\n");
}

TEST(ReportTest, AggregatesCounters) {
  Report report;
  report.accounts.push_back(MakeClosed(1, {Transaction::Deposit(1, 1, Amount::FromUnits(1)),
                                           Transaction::Withdrawal(1, 2, Amount::FromUnits(5))}));
  report.accounts.push_back(
      MakeClosed(4, {Transaction::Dispute(4, 9), Transaction::Deposit(4, 3, Amount::FromUnits(1))}));

  EXPECT_EQ(report.TotalApplied(), 2u);
  EXPECT_EQ(report.TotalRejected(), 2u);
  EXPECT_EQ(report.RejectedCount(ApplyError::kInsufficientFunds), 1u);
  EXPECT_EQ(report.RejectedCount(ApplyError::kUnknownTx), 1u);
  EXPECT_EQ(report.RejectedCount(ApplyError::kAccountLocked), 0u);

  ASSERT_NE(report.FindAccount(4), nullptr);
  EXPECT_EQ(report.FindAccount(4)->account.GetClientId(), 4);
  EXPECT_EQ(report.FindAccount(2), nullptr);
  EXPECT_EQ(report.FindAccount(5), nullptr);
}
