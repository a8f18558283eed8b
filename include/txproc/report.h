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

#include <cstdint>
#include <ostream>
#include <vector>

#include "txproc/account.h"
#include "txproc/account_actor.h"

namespace txproc {

struct DispatchSummary {
  uint64_t routed = 0;
  uint64_t accounts = 0;
};

struct Report {
  // ordered by client id
  std::vector<ClosedAccount> accounts;
  DispatchSummary dispatch;
  uint64_t skipped_records = 0;

  uint64_t TotalApplied() const;
  uint64_t TotalRejected() const;
  uint64_t RejectedCount(ApplyError error) const;
  const ClosedAccount* FindAccount(ClientId client_id) const;
};

/**
 * @brief Print the account table, `client,available,held,total,locked`, one row per account.
 */
void WriteReport(std::ostream& os, const Report& report);

}  // namespace txproc
