#pragma once

#include <absl/base/thread_annotations.h>
#include <absl/synchronization/mutex.h>

namespace util {

using mutex = absl::Mutex;

class ABSL_SCOPED_LOCKABLE AbslMutexLockGuard {
 public:
  explicit AbslMutexLockGuard(absl::Mutex& mutex)
      ABSL_EXCLUSIVE_LOCK_FUNCTION(mutex)
      : m_mutex_(mutex) {
    m_mutex_.Lock();
  }

  AbslMutexLockGuard(const AbslMutexLockGuard&) = delete;
  AbslMutexLockGuard& operator=(const AbslMutexLockGuard&) = delete;

  ~AbslMutexLockGuard() ABSL_UNLOCK_FUNCTION() { m_mutex_.Unlock(); }

 private:
  absl::Mutex& m_mutex_;
};

}  // namespace util
