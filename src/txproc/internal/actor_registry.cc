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

#include "txproc/internal/actor_registry.h"

namespace txproc::internal {

ActorRegistry::ActorRegistry(std::unique_ptr<TypeErasedActorScheduler> scheduler) : scheduler_(std::move(scheduler)) {
  TXP_THROW_CHECK(scheduler_ != nullptr) << "ActorRegistry needs a scheduler";
  std::random_device rd;
  random_num_generator_ = std::mt19937_64(rd());
}

ActorRegistry::~ActorRegistry() {
  std::unordered_map<uint64_t, std::unique_ptr<TypeErasedActor>> actors;
  {
    std::scoped_lock locker(mu_);
    actors.swap(actor_id_to_actor_);
  }
  logging::Debug("Sending destroy messages to {} actors", actors.size());
  // bulk destroy actors, let them drain in parallel before waiting on any of them
  for (auto& [_, actor] : actors) {
    actor->RequestDestroy();
  }
  actors.clear();
  logging::Debug("All actors destroyed");
}

uint64_t ActorRegistry::GenerateRandomActorId() {
  while (true) {
    auto id = random_num_generator_();
    if (!actor_id_to_actor_.contains(id)) {
      return id;
    }
  }
}
}  // namespace txproc::internal
