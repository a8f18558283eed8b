#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

#include "txproc/internal/alias.h"  // IWYU pragma: keep

#if defined(__linux__)
#include <pthread.h>
#endif

namespace txproc::internal::util {
/**
 * @brief Mutex-guarded FIFO queue. Used as the actor mailbox, where FIFO order across producers is what gives
 * per-account ordering.
 */
template <class T>
struct LinearizableUnboundedQueue {
 public:
  void Push(T value) {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(value));
  }

  std::optional<T> TryPop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    auto value = std::move(queue_.front());
    queue_.pop();
    return value;
  }

  size_t Size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  std::queue<T> queue_;
  mutable std::mutex mutex_;
};

#if defined(__linux__)
inline void SetThreadName(const std::string& name) { pthread_setname_np(pthread_self(), name.c_str()); }
#else
inline void SetThreadName(const std::string&) {}
#endif
}  // namespace txproc::internal::util
