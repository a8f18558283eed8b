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
#include <memory>
#include <mutex>
#include <random>
#include <unordered_map>
#include <utility>

#include "txproc/internal/actor.h"
#include "txproc/internal/actor_config.h"
#include "txproc/internal/actor_ref.h"
#include "txproc/internal/logging.h"
#include "txproc/internal/scheduler.h"

namespace txproc::internal {

/**
 * @brief Owns every actor created through it. Destroying the registry destroys all of its actors, after each of them
 * has drained the messages already in its mailbox. Thread-safe.
 */
class ActorRegistry {
 public:
  explicit ActorRegistry(std::unique_ptr<TypeErasedActorScheduler> scheduler);

  template <ex::scheduler Scheduler>
  explicit ActorRegistry(Scheduler scheduler)
      : ActorRegistry(std::make_unique<AnyStdExecScheduler<Scheduler>>(std::move(scheduler))) {}

  ActorRegistry(const ActorRegistry&) = delete;
  ActorRegistry& operator=(const ActorRegistry&) = delete;

  ~ActorRegistry();

  /**
   * @brief Create an actor with a manually specified config.
   */
  template <class UserClass, class... Args>
  ActorRef<UserClass> CreateActor(ActorConfig config, Args&&... args) {
    std::scoped_lock locker(mu_);
    auto actor_id = GenerateRandomActorId();
    auto actor = std::make_unique<Actor<UserClass>>(scheduler_->Clone(), std::move(config), std::forward<Args>(args)...);
    auto handle = ActorRef<UserClass>(actor_id, actor.get());
    actor_id_to_actor_[actor_id] = std::move(actor);
    return handle;
  }

  /**
   * @brief Create an actor using default config.
   */
  template <class UserClass, class... Args>
  ActorRef<UserClass> CreateActor(Args&&... args) {
    return CreateActor<UserClass>(ActorConfig {}, std::forward<Args>(args)...);
  }

 private:
  std::unique_ptr<TypeErasedActorScheduler> scheduler_;
  std::mutex mu_;
  std::mt19937_64 random_num_generator_;
  std::unordered_map<uint64_t, std::unique_ptr<TypeErasedActor>> actor_id_to_actor_;

  uint64_t GenerateRandomActorId();
};
}  // namespace txproc::internal

namespace txproc {
using internal::ActorRegistry;
}  // namespace txproc
