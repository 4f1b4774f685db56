#include "DeviceManager.h"

#include <absl/cleanup/cleanup.h>

namespace Dp {

CachedDeviceManager::CachedDeviceManager(absl::Duration cache_ttl)
    : m_cache_ttl_(cache_ttl) {}

bool CachedDeviceManager::CacheFresh_() const {
  return m_cache_valid_ && absl::Now() - m_last_discovery_ < m_cache_ttl_;
}

MicrodpErr CachedDeviceManager::DiscoverDevices(std::vector<Device>* devices) {
  m_mtx_.Lock();

  while (!CacheFresh_() && m_refresh_in_progress_) {
    uint64_t generation = m_refresh_generation_;
    m_mtx_.Await(absl::Condition(
        +[](bool* in_progress) { return !*in_progress; },
        &m_refresh_in_progress_));

    // Share the result of the refresh we waited for, failed or not.
    if (m_refresh_generation_ != generation &&
        m_last_refresh_err_ != MicrodpErr::kOk) {
      MicrodpErr err = m_last_refresh_err_;
      m_mtx_.Unlock();
      return err;
    }
  }

  if (CacheFresh_()) {
    *devices = m_devices_;
    m_mtx_.Unlock();
    return MicrodpErr::kOk;
  }

  m_refresh_in_progress_ = true;
  m_mtx_.Unlock();

  // Waiters block until the flag is cleared, so clear it even if the
  // discovery throws.
  bool published = false;
  absl::Cleanup end_refresh = [this, &published] {
    if (published) return;
    LockGuard guard(m_mtx_);
    m_refresh_in_progress_ = false;
    m_refresh_generation_++;
    m_last_refresh_err_ = MicrodpErr::kDiscoveryFailure;
  };

  std::vector<Device> discovered;
  MicrodpErr err = DiscoverDevicesNoCache_(&discovered);

  LockGuard guard(m_mtx_);
  published = true;
  m_refresh_in_progress_ = false;
  m_refresh_generation_++;

  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("{} device discovery failed: {}", Vendor(),
                  MicrodpErrStr(err));
    m_last_refresh_err_ = MicrodpErr::kDiscoveryFailure;
    return MicrodpErr::kDiscoveryFailure;
  }
  m_last_refresh_err_ = MicrodpErr::kOk;

  m_devices_ = discovered;
  m_device_map_.clear();
  for (auto&& device : discovered) m_device_map_.emplace(device.id, device);
  m_last_discovery_ = absl::Now();
  m_cache_valid_ = true;

  MICRODP_DEBUG("Discovered {} {} device(s).", discovered.size(), Vendor());

  *devices = std::move(discovered);
  return MicrodpErr::kOk;
}

bool CachedDeviceManager::CheckHealth(const std::string& device_id) {
  Device device;
  {
    LockGuard guard(m_mtx_);
    auto iter = m_device_map_.find(device_id);
    if (iter == m_device_map_.end()) {
      MICRODP_WARN("Health of unknown {} device {} requested.", Vendor(),
                   device_id);
      return false;
    }
    device = iter->second;
  }

  return CheckDeviceHealth_(device);
}

void CachedDeviceManager::InvalidateCache() {
  LockGuard guard(m_mtx_);
  m_cache_valid_ = false;
}

}  // namespace Dp
