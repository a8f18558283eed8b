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

#include <exec/task.hpp>

#include "txproc/dispatcher.h"
#include "txproc/report.h"

namespace txproc {

/**
 * @brief Close every account actor in the routing table and gather what they yield. Each Close() is queued behind the
 * transactions already in that actor's mailbox, so the accounts are final. The report is ordered by client id, its
 * dispatch summary is left for the caller to fill.
 */
exec::task<Report> CollectAccounts(RoutingTable routing_table);

}  // namespace txproc
