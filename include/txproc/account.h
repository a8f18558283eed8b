// Copyright 2025 The txproc Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <unordered_map>

#include "txproc/amount.h"
#include "txproc/transaction.h"

namespace txproc {

enum class ApplyError : uint8_t {
  kDuplicateTxId = 0,
  kInsufficientFunds = 1,
  kUnknownTx = 2,
  kInvalidDisputeState = 3,
  kAccountLocked = 4,
  // the account total would leave the range of Amount
  kAmountOverflow = 5,
};
inline constexpr size_t kApplyErrorCount = 6;

std::string_view ToString(ApplyError error);
std::ostream& operator<<(std::ostream& os, ApplyError error);

// Empty on success.
using ApplyResult = std::optional<ApplyError>;

enum class DisputeStatus : uint8_t {
  kNormal = 0,
  kDisputed = 1,
  kResolved = 2,
  kChargedBack = 3,
};

std::string_view ToString(DisputeStatus status);
std::ostream& operator<<(std::ostream& os, DisputeStatus status);

struct LedgerEntry {
  Amount amount;
  // kDeposit or kWithdrawal
  TransactionKind origin;
  DisputeStatus status = DisputeStatus::kNormal;
};

struct AccountPolicy {
  // Disputing a withdrawal holds its amount out of `available`, the same as a deposit.
  bool allow_withdrawal_disputes = false;
};

/**
 * @brief Money and dispute bookkeeping of one client. Not thread-safe, it's owned by exactly one AccountActor.
 *
 * Invariants, at every point between two Apply() calls:
 * - available >= 0, held >= 0, total == available + held.
 * - once locked, nothing changes any more.
 * - a ledger entry only moves kNormal -> kDisputed -> kResolved | kChargedBack.
 */
class Account {
 public:
  explicit Account(ClientId client_id, AccountPolicy policy = {}) : client_id_(client_id), policy_(policy) {}

  /**
   * @brief Apply one transaction. A failure leaves the account untouched.
   * @note The caller must not apply the same transaction twice, the ledger only guards Deposit/Withdrawal tx ids.
   */
  [[nodiscard]] ApplyResult Apply(const Transaction& tx);

  ClientId GetClientId() const { return client_id_; }
  Amount GetAvailable() const { return available_; }
  Amount GetHeld() const { return held_; }
  Amount GetTotal() const { return available_ + held_; }
  bool IsLocked() const { return locked_; }
  const AccountPolicy& GetPolicy() const { return policy_; }

  const LedgerEntry* FindLedgerEntry(TxId tx_id) const;
  size_t LedgerSize() const { return ledger_.size(); }

  // Throws if any of the invariants above is broken.
  void CheckInvariants() const;

 private:
  ClientId client_id_;
  AccountPolicy policy_;
  Amount available_;
  Amount held_;
  bool locked_ = false;
  std::unordered_map<TxId, LedgerEntry> ledger_;

  ApplyResult ApplyDeposit(const Transaction& tx);
  ApplyResult ApplyWithdrawal(const Transaction& tx);
  ApplyResult ApplyDispute(const Transaction& tx);
  ApplyResult ApplyResolve(const Transaction& tx);
  ApplyResult ApplyChargeback(const Transaction& tx);
};

}  // namespace txproc
