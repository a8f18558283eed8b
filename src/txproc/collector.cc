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

#include "txproc/collector.h"

#include <algorithm>
#include <utility>
#include <vector>

#include <exec/async_scope.hpp>

#include "txproc/internal/logging.h"

namespace txproc {

exec::task<Report> CollectAccounts(RoutingTable routing_table) {
  auto make_close_sender = [](const ActorRef<AccountActor>& account_actor) {
    return account_actor.Send<&AccountActor::Close>();
  };

  exec::async_scope async_scope;
  using FutureType = decltype(async_scope.spawn_future(make_close_sender(std::declval<ActorRef<AccountActor>>())));
  std::vector<FutureType> futures;
  futures.reserve(routing_table.size());
  for (const auto& [_, account_actor] : routing_table) {
    futures.push_back(async_scope.spawn_future(make_close_sender(account_actor)));
  }
  co_await async_scope.on_empty();

  Report report;
  report.accounts.reserve(futures.size());
  for (auto& future : futures) {
    report.accounts.push_back(co_await std::move(future));
  }
  std::sort(report.accounts.begin(), report.accounts.end(), [](const ClosedAccount& lhs, const ClosedAccount& rhs) {
    return lhs.account.GetClientId() < rhs.account.GetClientId();
  });
  internal::logging::Info("Collected {} accounts, applied={}, rejected={}", report.accounts.size(),
                          report.TotalApplied(), report.TotalRejected());
  co_return report;
}

}  // namespace txproc
