#pragma once

#include <atomic>
#include <cstring>
#include <pthread.h>
#include <sched.h>
#include <thread>
#include <utility>

#include "logging.h"

namespace Common {

  /// Set affinity for current thread to be pinned to the provided core_id
  inline auto setThreadCore(int core_id) noexcept -> bool {
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(static_cast<size_t>(core_id), &cpuset);

    return (pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0);
  }

  /// Names the current thread (truncated to the 15 characters the kernel keeps)
  inline auto setThreadName(const char* name) noexcept -> void {
    char truncated_name[16];
    std::strncpy(truncated_name, name, 15);
    truncated_name[15] = '\0';
    pthread_setname_np(pthread_self(), truncated_name);
  }

  /// Starts func on a new named thread, pinned to core_id when core_id >= 0.
  /// A failed pin is logged and the thread keeps running unpinned.
  template<typename F>
  inline auto createAndStartThread(int core_id, const char* name, F&& func) -> std::thread {
    return std::thread([core_id, name, func = std::forward<F>(func)]() mutable {
      if (core_id >= 0 && !setThreadCore(core_id)) {
        LOG_WARN("Failed to set core affinity for %s to %d", name, core_id);
      }
      setThreadName(name);
      func();
    });
  }

} // namespace Common
