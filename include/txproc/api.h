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

// IWYU pragma: begin_exports
#include "txproc/account.h"
#include "txproc/account_actor.h"
#include "txproc/amount.h"
#include "txproc/collector.h"
#include "txproc/dispatcher.h"
#include "txproc/engine.h"
#include "txproc/internal/actor_config.h"
#include "txproc/internal/actor_ref.h"
#include "txproc/internal/actor_registry.h"
#include "txproc/internal/logging.h"
#include "txproc/internal/scheduler.h"
#include "txproc/report.h"
#include "txproc/transaction.h"
#include "txproc/transaction_source.h"
// IWYU pragma: end_exports
