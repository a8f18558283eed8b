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

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string_view>
#include <thread>

#include <exec/task.hpp>

#include "txproc/account.h"
#include "txproc/internal/actor_registry.h"
#include "txproc/internal/scheduler.h"
#include "txproc/report.h"
#include "txproc/transaction_source.h"

namespace txproc {

enum class SchedulerKind : uint8_t {
  // one shared run queue
  kWorkSharing = 0,
  // stdexec's static_thread_pool
  kWorkStealing = 1,
};

std::string_view ToString(SchedulerKind kind);
std::ostream& operator<<(std::ostream& os, SchedulerKind kind);

struct EngineConfig {
  size_t thread_pool_size = std::max<size_t>(1, std::thread::hardware_concurrency());
  SchedulerKind scheduler = SchedulerKind::kWorkSharing;
  AccountPolicy account_policy;
  std::chrono::microseconds tx_delay {0};
  size_t max_message_executed_per_activation = 100;
  // How many records the dispatcher routes per message. Between two batches other actors get its worker.
  size_t dispatch_batch_size = 1024;
};

/**
 * @brief Runs transaction sources through dispatcher -> account actors -> collector on a fixed thread pool.
 *
 * Example:
 * ```cpp
 * txproc::Engine engine({.thread_pool_size = 4});
 * txproc::CsvTransactionSource source("transactions.csv");
 * txproc::Report report = engine.Run(source);
 * txproc::WriteReport(std::cout, report);
 * ```
 */
class Engine {
 public:
  explicit Engine(EngineConfig config = {});
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  /**
   * @brief Process the whole source and return the final accounts. Blocks the calling thread, don't call it from
   * inside an actor. Every actor of the run is destroyed before it returns.
   */
  Report Run(TransactionSource& source);

  const EngineConfig& GetConfig() const { return config_; }

 private:
  EngineConfig config_;
  std::unique_ptr<WorkSharingThreadPool> work_sharing_pool_;
  std::unique_ptr<WorkStealingThreadPool> work_stealing_pool_;
  std::unique_ptr<internal::TypeErasedActorScheduler> scheduler_;

  exec::task<Report> RunAsync(ActorRegistry& registry, TransactionSource& source);
};

}  // namespace txproc
