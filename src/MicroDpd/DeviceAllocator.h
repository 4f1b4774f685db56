#pragma once

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include <string>
#include <vector>

#include "microdp/Lock.h"
#include "microdp/PublicHeader.h"

namespace Dp {

/**
 * Records which workload owns which device. Devices absent from the map are
 * free. Every method takes the same lock and never calls outside the class
 * while holding it.
 */
class DeviceAllocator {
 public:
  DeviceAllocator() = default;

  /***
   * Assign every device in `device_ids` to `owner`, or none of them.
   * @return kAlreadyAllocated if any device is taken. Nothing is changed in
   * this case.
   */
  MicrodpErr Allocate(const std::vector<std::string>& device_ids,
                      const std::string& owner) LOCKS_EXCLUDED(m_mtx_);

  // Free devices are ignored.
  void Deallocate(const std::vector<std::string>& device_ids)
      LOCKS_EXCLUDED(m_mtx_);

  bool IsAvailable(const std::string& device_id) LOCKS_EXCLUDED(m_mtx_);

  // Empty if the device is free or was allocated without a known owner.
  std::string GetOwner(const std::string& device_id) LOCKS_EXCLUDED(m_mtx_);

  // Release every allocation of a device which is no longer discovered.
  void CleanupOrphanedDevices(
      const absl::flat_hash_set<std::string>& discovered_ids)
      LOCKS_EXCLUDED(m_mtx_);

  absl::flat_hash_map<std::string, std::string> Snapshot()
      LOCKS_EXCLUDED(m_mtx_);

  std::vector<std::string> GetAllocatedDevices() LOCKS_EXCLUDED(m_mtx_);

 private:
  using Mutex = util::mutex;
  using LockGuard = util::AbslMutexLockGuard;

  // device id -> owner
  absl::flat_hash_map<std::string, std::string> m_owner_map_
      GUARDED_BY(m_mtx_);

  Mutex m_mtx_;
};

}  // namespace Dp
