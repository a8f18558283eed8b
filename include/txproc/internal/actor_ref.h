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

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "txproc/internal/actor.h"

namespace txproc::internal {
template <class UserClass>
class ActorRef {
 public:
  ActorRef() : is_empty_(true) {}

  ActorRef(uint64_t actor_id, TypeErasedActor* actor)
      : is_empty_(false), actor_id_(actor_id), type_erased_actor_(actor) {}

  friend bool operator==(const ActorRef& lhs, const ActorRef& rhs) {
    if (lhs.is_empty_ && rhs.is_empty_) {
      return true;
    }
    return lhs.is_empty_ == rhs.is_empty_ && lhs.actor_id_ == rhs.actor_id_;
  }

  /**
   * @brief Send message to the actor. Returns a sender carrying the result of the method. Messages sent from one
   * thread to the same actor are executed in the order they are sent.
   * @note No heap allocation, the args are moved into the operation state of the returned sender.
   */
  template <auto kMethod, class... Args>
  [[nodiscard]] ex::sender auto Send(Args&&... args) const {
    static_assert(std::is_invocable_v<decltype(kMethod), UserClass*, Args...>,
                  "method is not invocable with the provided arguments");
    if (IsEmpty()) [[unlikely]] {
      throw std::runtime_error("Empty ActorRef, cannot call method on it.");
    }
    return type_erased_actor_->template CallActorMethod<kMethod>(std::forward<Args>(args)...);
  }

  bool IsEmpty() const { return is_empty_; }

  uint64_t GetActorId() const { return actor_id_; }

 private:
  bool is_empty_;
  uint64_t actor_id_ = 0;
  TypeErasedActor* type_erased_actor_ = nullptr;
};
}  // namespace txproc::internal

namespace txproc {
using internal::ActorRef;
}  // namespace txproc

namespace std {
template <class UserClass>
struct hash<txproc::ActorRef<UserClass>> {
  size_t operator()(const txproc::ActorRef<UserClass>& ref) const {
    if (ref.IsEmpty()) {
      return 0;
    }
    return std::hash<uint64_t>()(ref.GetActorId());
  }
};
}  // namespace std
