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

#include "txproc/engine.h"

#include <exception>
#include <tuple>
#include <utility>

#include "txproc/collector.h"
#include "txproc/dispatcher.h"
#include "txproc/internal/logging.h"

namespace txproc {

std::string_view ToString(SchedulerKind kind) {
  switch (kind) {
    case SchedulerKind::kWorkSharing:
      return "work-sharing";
    case SchedulerKind::kWorkStealing:
      return "work-stealing";
  }
  TXP_THROW << "Invalid scheduler kind: " << static_cast<int>(kind);
}

std::ostream& operator<<(std::ostream& os, SchedulerKind kind) { return os << ToString(kind); }

Engine::Engine(EngineConfig config) : config_(config) {
  TXP_THROW_CHECK_GT(config_.thread_pool_size, 0) << "Engine needs at least one worker thread";
  TXP_THROW_CHECK_GT(config_.dispatch_batch_size, 0);
  TXP_THROW_CHECK_GT(config_.max_message_executed_per_activation, 0);

  switch (config_.scheduler) {
    case SchedulerKind::kWorkSharing: {
      work_sharing_pool_ = std::make_unique<WorkSharingThreadPool>(config_.thread_pool_size);
      scheduler_ = std::make_unique<internal::AnyStdExecScheduler<WorkSharingThreadPool::Scheduler>>(
          work_sharing_pool_->GetScheduler());
      break;
    }
    case SchedulerKind::kWorkStealing: {
      work_stealing_pool_ = std::make_unique<WorkStealingThreadPool>(static_cast<uint32_t>(config_.thread_pool_size));
      using Scheduler = decltype(work_stealing_pool_->GetScheduler());
      scheduler_ = std::make_unique<internal::AnyStdExecScheduler<Scheduler>>(work_stealing_pool_->GetScheduler());
      break;
    }
  }
  TXP_THROW_CHECK(scheduler_ != nullptr) << "Unknown scheduler kind " << config_.scheduler;

  const auto thread_pool_size = config_.thread_pool_size;
  const auto scheduler = config_.scheduler;
  internal::logging::Info("Engine started, {}", TXP_DUMP_VARS(thread_pool_size, scheduler));
}

Engine::~Engine() { internal::logging::Info("Engine stopped"); }

Report Engine::Run(TransactionSource& source) {
  // a fresh registry per run, its destructor tears down every actor of the run
  ActorRegistry registry(scheduler_->Clone());
  auto result = ex::sync_wait(RunAsync(registry, source));
  TXP_THROW_CHECK(result.has_value()) << "Engine run was stopped before finishing";
  return std::get<0>(std::move(result).value());
}

exec::task<Report> Engine::RunAsync(ActorRegistry& registry, TransactionSource& source) {
  auto dispatcher = registry.CreateActor<Dispatcher>(
      ActorConfig {.max_message_executed_per_activation = 1}, &registry, &source,
      DispatcherOptions {
          .account_options = {.policy = config_.account_policy, .tx_delay = config_.tx_delay},
          .max_message_executed_per_activation = config_.max_message_executed_per_activation,
      });

  std::exception_ptr dispatch_error;
  try {
    while (co_await dispatcher.Send<&Dispatcher::DispatchBatch>(config_.dispatch_batch_size)) {
    }
  } catch (const std::exception& e) {
    internal::logging::Error("Dispatch failed, draining the transactions routed so far. {}", e.what());
    dispatch_error = std::current_exception();
  }

  // always wait for the routed transactions, the account actors still reference the dispatcher's scope
  RoutingTable routing_table = co_await dispatcher.Send<&Dispatcher::Finish>();
  if (dispatch_error) {
    std::rethrow_exception(dispatch_error);
  }
  DispatchSummary summary = co_await dispatcher.Send<&Dispatcher::GetSummary>();

  Report report = co_await CollectAccounts(std::move(routing_table));
  report.dispatch = summary;
  report.skipped_records = source.SkippedRecords();
  const auto skipped_records = report.skipped_records;
  internal::logging::Info("Run finished, {}", TXP_DUMP_VARS(summary, skipped_records));
  for (size_t i = 0; i < kApplyErrorCount; ++i) {
    auto error = static_cast<ApplyError>(i);
    if (auto count = report.RejectedCount(error); count > 0) {
      internal::logging::Info("Rejected with {}: {}", ToString(error), count);
    }
  }
  co_return report;
}

}  // namespace txproc
