#pragma once

#include <absl/container/flat_hash_map.h>
#include <absl/time/clock.h>

#include <string>
#include <string_view>
#include <vector>

#include "DpdPublicDefs.h"
#include "microdp/Lock.h"
#include "protos/DevicePlugin.pb.h"

namespace Dp {

/**
 * Implemented by the vendors whose GPUs can be split into partitions.
 */
class IPartitionConfigurator {
 public:
  virtual ~IPartitionConfigurator() = default;

  // Bring every GPU on this node to the configured partition layout. Failures
  // on one GPU are logged and the remaining GPUs are still processed.
  virtual MicrodpErr ConfigurePartitions() = 0;
};

class IDeviceManager {
 public:
  virtual ~IDeviceManager() = default;

  // "nvidia", "huawei" or "simulator".
  virtual std::string_view Vendor() const = 0;

  virtual MicrodpErr DiscoverDevices(std::vector<Device>* devices) = 0;

  // An unknown id or a failed query reports unhealthy.
  virtual bool CheckHealth(const std::string& device_id) = 0;

  virtual void InvalidateCache() {}

  // nullptr if the vendor doesn't support partitioning.
  virtual IPartitionConfigurator* PartitionConfigurator() { return nullptr; }

  // The environment variable which tells the vendor runtime in the container
  // which devices it may use.
  virtual std::string_view VisibleDevicesEnv() const = 0;

  // Fill the environment, device nodes and mounts the container needs to
  // use `devices`.
  virtual void BuildContainerResponse(
      const std::vector<Device>& devices,
      v1beta1::ContainerAllocateResponse* response) const = 0;
};

/**
 * Keeps the result of the last successful discovery for a fixed period.
 * The vendor tool is never invoked with the lock held. When the cache is
 * expired, exactly one caller refreshes it and concurrent callers wait for
 * that refresh instead of starting their own.
 */
class CachedDeviceManager : public IDeviceManager {
 public:
  MicrodpErr DiscoverDevices(std::vector<Device>* devices) final
      LOCKS_EXCLUDED(m_mtx_);

  bool CheckHealth(const std::string& device_id) final LOCKS_EXCLUDED(m_mtx_);

  void InvalidateCache() override LOCKS_EXCLUDED(m_mtx_);

 protected:
  explicit CachedDeviceManager(absl::Duration cache_ttl);

  virtual MicrodpErr DiscoverDevicesNoCache_(std::vector<Device>* devices) = 0;

  virtual bool CheckDeviceHealth_(const Device& device) = 0;

 private:
  using Mutex = util::mutex;
  using LockGuard = util::AbslMutexLockGuard;

  bool CacheFresh_() const EXCLUSIVE_LOCKS_REQUIRED(m_mtx_);

  const absl::Duration m_cache_ttl_;

  Mutex m_mtx_;

  bool m_cache_valid_ GUARDED_BY(m_mtx_){false};
  absl::Time m_last_discovery_ GUARDED_BY(m_mtx_);
  std::vector<Device> m_devices_ GUARDED_BY(m_mtx_);
  absl::flat_hash_map<std::string, Device> m_device_map_ GUARDED_BY(m_mtx_);

  bool m_refresh_in_progress_ GUARDED_BY(m_mtx_){false};
  uint64_t m_refresh_generation_ GUARDED_BY(m_mtx_){0};
  MicrodpErr m_last_refresh_err_ GUARDED_BY(m_mtx_){MicrodpErr::kOk};
};

}  // namespace Dp
