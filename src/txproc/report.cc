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

#include "txproc/report.h"

#include <algorithm>

namespace txproc {

uint64_t Report::TotalApplied() const {
  uint64_t total = 0;
  for (const auto& closed : accounts) {
    total += closed.stats.applied;
  }
  return total;
}

uint64_t Report::TotalRejected() const {
  uint64_t total = 0;
  for (const auto& closed : accounts) {
    total += closed.stats.TotalRejected();
  }
  return total;
}

uint64_t Report::RejectedCount(ApplyError error) const {
  uint64_t total = 0;
  for (const auto& closed : accounts) {
    total += closed.stats.Rejected(error);
  }
  return total;
}

const ClosedAccount* Report::FindAccount(ClientId client_id) const {
  auto iter = std::lower_bound(accounts.begin(), accounts.end(), client_id,
                               [](const ClosedAccount& closed, ClientId id) { return closed.account.GetClientId() < id; });
  if (iter == accounts.end() || iter->account.GetClientId() != client_id) {
    return nullptr;
  }
  return &*iter;
}

void WriteReport(std::ostream& os, const Report& report) {
  os << "client,available,held,total,locked\n";
  for (const auto& [account, _] : report.accounts) {
    os << account.GetClientId() << ',' << account.GetAvailable() << ',' << account.GetHeld() << ','
       << account.GetTotal() << ',' << (account.IsLocked() ? "true" : "false") << '\n';
  }
  os.flush();
}

}  // namespace txproc
