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

#include "txproc/account_actor.h"

#include <thread>
#include <utility>

#include "txproc/internal/logging.h"

namespace txproc {

AccountActor::AccountActor(ClientId client_id, AccountActorOptions options)
    : account_(client_id, options.policy), options_(options) {}

void AccountActor::Apply(const Transaction& tx) {
  TXP_THROW_IF(closed_) << "Account actor of client " << account_.GetClientId()
                        << " is closed, can't apply " << tx;
  if (options_.tx_delay.count() > 0) {
    std::this_thread::sleep_for(options_.tx_delay);
  }

  const ClientId client_id = tx.GetClientId();
  const TxId tx_id = tx.GetTxId();
  const TransactionKind kind = tx.GetKind();
  auto result = account_.Apply(tx);
  if (!result.has_value()) {
    stats_.applied++;
    internal::logging::Debug("Applied {} tx={} on client {}", ToString(kind), tx_id, client_id);
    return;
  }

  const ApplyError error = *result;
  stats_.rejected.at(static_cast<size_t>(error))++;
  internal::logging::Warn("Transaction rejected, {}", TXP_DUMP_VARS(client_id, tx_id, kind, error));
}

ClosedAccount AccountActor::Close() {
  TXP_THROW_IF(closed_) << "Account actor of client " << account_.GetClientId() << " is already closed";
  closed_ = true;
  return ClosedAccount {.account = account_, .stats = stats_};
}

}  // namespace txproc
