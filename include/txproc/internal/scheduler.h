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

#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <exec/async_scope.hpp>
#include <exec/static_thread_pool.hpp>

#include "txproc/internal/logging.h"
#include "txproc/internal/util.h"

namespace txproc {

class WorkSharingThreadPool {
 public:
  explicit WorkSharingThreadPool(size_t thread_count) {
    TXP_THROW_CHECK_GT(thread_count, 0) << "WorkSharingThreadPool needs at least one worker";
    workers_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
      workers_.emplace_back([this](const std::stop_token& stop_token) { WorkerThreadLoop(stop_token); });
    }
  }

  struct TypeEasedOperation {
    virtual ~TypeEasedOperation() = default;
    virtual void Execute() = 0;
  };

  template <ex::receiver R>
  struct Operation : TypeEasedOperation {
    Operation(R receiver, WorkSharingThreadPool* thread_pool)
        : receiver(std::move(receiver)), thread_pool(thread_pool) {}
    R receiver;
    WorkSharingThreadPool* thread_pool;
    void Execute() override {
      auto stoken = stdexec::get_stop_token(stdexec::get_env(receiver));
      if constexpr (ex::unstoppable_token<decltype(stoken)>) {
        receiver.set_value();
      } else {
        if (stoken.stop_requested()) {
          receiver.set_stopped();
        } else {
          receiver.set_value();
        }
      }
    }

    void start() noexcept { thread_pool->EnqueueOperation(this); }
  };

  struct Scheduler;

  struct Sender : ex::sender_t {
    // NOLINTNEXTLINE(readability-identifier-naming)
    using completion_signatures = ex::completion_signatures<ex::set_value_t(), ex::set_stopped_t()>;
    WorkSharingThreadPool* thread_pool;
    struct Env {
      WorkSharingThreadPool* thread_pool;
      template <class CPO>
      auto query(ex::get_completion_scheduler_t<CPO>) const noexcept -> Scheduler {
        return {.thread_pool = thread_pool};
      }
    };
    auto get_env() const noexcept -> Env { return Env {.thread_pool = thread_pool}; }
    template <ex::receiver R>
    Operation<R> connect(R receiver) {
      return {std::move(receiver), thread_pool};
    }
  };

  struct Scheduler : ex::scheduler_t {
    WorkSharingThreadPool* thread_pool;
    Sender schedule() const noexcept { return {.thread_pool = thread_pool}; }
    friend bool operator==(const Scheduler& lhs, const Scheduler& rhs) noexcept {
      return lhs.thread_pool == rhs.thread_pool;
    }
  };

  Scheduler GetScheduler() noexcept { return Scheduler {.thread_pool = this}; }

  void EnqueueOperation(TypeEasedOperation* operation) { queue_.enqueue(operation); }

  size_t GetThreadCount() const { return workers_.size(); }

 private:
  moodycamel::BlockingConcurrentQueue<TypeEasedOperation*> queue_;
  std::vector<std::jthread> workers_;

  void WorkerThreadLoop(const std::stop_token& stop_token) {
    internal::util::SetThreadName("ws_pool_worker");
    TypeEasedOperation* operation = nullptr;
    while (!stop_token.stop_requested()) {
      // bounded wait, so a stop request is noticed even when the queue stays empty
      bool ok = queue_.wait_dequeue_timed(operation, std::chrono::milliseconds(10));
      if (!ok) {
        continue;
      }
      operation->Execute();
    }
  }
};

class WorkStealingThreadPool : public exec::static_thread_pool {
 public:
  using exec::static_thread_pool::static_thread_pool;
  auto GetScheduler() { return get_scheduler(); }
};

}  // namespace txproc

namespace txproc::internal {
/**
 * @brief Erases the concrete std::execution scheduler, so actors and the registry don't need to be templates on it.
 * An implementation only has to know how to run a callback on one of its workers.
 */
class TypeErasedActorScheduler {
 public:
  virtual ~TypeErasedActorScheduler() = default;
  /**
   * @brief Schedule `fn` on the underlying scheduler, tracking the work in `scope`.
   */
  virtual void Spawn(exec::async_scope& scope, std::function<void()> fn) = 0;
  virtual std::unique_ptr<TypeErasedActorScheduler> Clone() const = 0;
};

template <ex::scheduler Scheduler>
class AnyStdExecScheduler : public TypeErasedActorScheduler {
 public:
  explicit AnyStdExecScheduler(Scheduler scheduler) : scheduler_(std::move(scheduler)) {}

  void Spawn(exec::async_scope& scope, std::function<void()> fn) override {
    scope.spawn(ex::schedule(scheduler_) | ex::then(std::move(fn)));
  }

  std::unique_ptr<TypeErasedActorScheduler> Clone() const override {
    return std::make_unique<AnyStdExecScheduler<Scheduler>>(scheduler_);
  }

 private:
  Scheduler scheduler_;
};
}  // namespace txproc::internal
