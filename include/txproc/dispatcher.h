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
#include <unordered_map>

#include <exec/async_scope.hpp>
#include <exec/task.hpp>

#include "txproc/account_actor.h"
#include "txproc/internal/actor_registry.h"
#include "txproc/report.h"
#include "txproc/transaction_source.h"

namespace txproc {

using RoutingTable = std::unordered_map<ClientId, ActorRef<AccountActor>>;

struct DispatcherOptions {
  AccountActorOptions account_options;
  size_t max_message_executed_per_activation = 100;
};

/**
 * @brief Splits the ordered input into one mailbox per client. Runs as an actor, the routing table is only touched
 * from its own messages.
 *
 * Per-client order holds because a transaction is pushed into its account's mailbox before the next one is read.
 */
class Dispatcher {
 public:
  Dispatcher(ActorRegistry* registry, TransactionSource* source, DispatcherOptions options = {});
  ~Dispatcher();

  /**
   * @brief Route up to `max_transactions` transactions. Returns false once the source is exhausted.
   */
  bool DispatchBatch(size_t max_transactions);

  /**
   * @brief Wait until every routed transaction has been applied, then hand out the routing table. The dispatcher is
   * empty afterwards.
   */
  exec::task<RoutingTable> Finish();

  DispatchSummary GetSummary() const { return summary_; }

 private:
  ActorRegistry* registry_;
  TransactionSource* source_;
  DispatcherOptions options_;
  RoutingTable routing_table_;
  DispatchSummary summary_;
  bool exhausted_ = false;
  exec::async_scope async_scope_;

  const ActorRef<AccountActor>& RouteFor(ClientId client_id);
};

}  // namespace txproc
