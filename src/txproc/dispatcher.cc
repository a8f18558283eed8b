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

#include "txproc/dispatcher.h"

#include <utility>

#include "txproc/internal/logging.h"

namespace txproc {

Dispatcher::Dispatcher(ActorRegistry* registry, TransactionSource* source, DispatcherOptions options)
    : registry_(registry), source_(source), options_(options) {
  TXP_THROW_CHECK(registry_ != nullptr) << "Dispatcher needs an actor registry";
  TXP_THROW_CHECK(source_ != nullptr) << "Dispatcher needs a transaction source";
}

Dispatcher::~Dispatcher() { ex::sync_wait(async_scope_.on_empty()); }

bool Dispatcher::DispatchBatch(size_t max_transactions) {
  if (exhausted_) {
    return false;
  }
  for (size_t i = 0; i < max_transactions; ++i) {
    auto tx = source_->Next();
    if (!tx.has_value()) {
      exhausted_ = true;
      return false;
    }
    const auto& account_actor = RouteFor(tx->GetClientId());
    // start() pushes into the mailbox right away, before we read the next record
    async_scope_.spawn(account_actor.Send<&AccountActor::Apply>(std::move(*tx)));
    summary_.routed++;
  }
  return true;
}

exec::task<RoutingTable> Dispatcher::Finish() {
  co_await async_scope_.on_empty();
  internal::logging::Info("Dispatch finished, {}", TXP_DUMP_VARS(summary_));
  co_return std::move(routing_table_);
}

const ActorRef<AccountActor>& Dispatcher::RouteFor(ClientId client_id) {
  auto iter = routing_table_.find(client_id);
  if (iter != routing_table_.end()) {
    return iter->second;
  }
  auto actor_ref = registry_->CreateActor<AccountActor>(
      ActorConfig {.max_message_executed_per_activation = options_.max_message_executed_per_activation},
      client_id, options_.account_options);
  summary_.accounts++;
  internal::logging::Debug("Created account actor for client {}", client_id);
  return routing_table_.emplace(client_id, actor_ref).first->second;
}

}  // namespace txproc
