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

#include <array>
#include <chrono>
#include <cstdint>
#include <numeric>

#include "txproc/account.h"
#include "txproc/transaction.h"

namespace txproc {

struct AccountActorStats {
  uint64_t applied = 0;
  // indexed by ApplyError
  std::array<uint64_t, kApplyErrorCount> rejected {};

  uint64_t TotalRejected() const { return std::accumulate(rejected.begin(), rejected.end(), uint64_t {0}); }
  uint64_t Rejected(ApplyError error) const { return rejected.at(static_cast<size_t>(error)); }
};

struct ClosedAccount {
  Account account;
  AccountActorStats stats;
};

struct AccountActorOptions {
  AccountPolicy policy;
  // Slept before every transaction. Only benchmarks set it, to make per-account work measurable.
  std::chrono::microseconds tx_delay {0};
};

/**
 * @brief Actor owning the Account of one client. Runs inside an Actor<AccountActor>, so Apply() calls never overlap
 * and run in the order they were sent.
 */
class AccountActor {
 public:
  explicit AccountActor(ClientId client_id, AccountActorOptions options = {});

  // Rejections are logged and counted, they never stop the actor.
  void Apply(const Transaction& tx);

  /**
   * @brief The last message of the actor. Yields the account, every later Apply() throws.
   */
  ClosedAccount Close();

  Account Snapshot() const { return account_; }
  AccountActorStats GetStats() const { return stats_; }

 private:
  Account account_;
  AccountActorStats stats_;
  AccountActorOptions options_;
  bool closed_ = false;
};

}  // namespace txproc
