#include "DeviceAllocator.h"

#include <boost/algorithm/string/join.hpp>

namespace Dp {

MicrodpErr DeviceAllocator::Allocate(const std::vector<std::string>& device_ids,
                                     const std::string& owner) {
  LockGuard guard(m_mtx_);

  for (auto&& id : device_ids) {
    auto iter = m_owner_map_.find(id);
    if (iter != m_owner_map_.end()) {
      MICRODP_WARN("Device {} is already allocated to \"{}\"", id,
                   iter->second);
      return MicrodpErr::kAlreadyAllocated;
    }
  }

  for (auto&& id : device_ids) m_owner_map_.emplace(id, owner);

  MICRODP_DEBUG("Devices [{}] allocated to \"{}\"",
                boost::join(device_ids, ", "), owner);
  return MicrodpErr::kOk;
}

void DeviceAllocator::Deallocate(const std::vector<std::string>& device_ids) {
  LockGuard guard(m_mtx_);

  for (auto&& id : device_ids) {
    if (m_owner_map_.erase(id) > 0) MICRODP_DEBUG("Device {} released", id);
  }
}

bool DeviceAllocator::IsAvailable(const std::string& device_id) {
  LockGuard guard(m_mtx_);
  return !m_owner_map_.contains(device_id);
}

std::string DeviceAllocator::GetOwner(const std::string& device_id) {
  LockGuard guard(m_mtx_);

  auto iter = m_owner_map_.find(device_id);
  if (iter == m_owner_map_.end()) return {};
  return iter->second;
}

void DeviceAllocator::CleanupOrphanedDevices(
    const absl::flat_hash_set<std::string>& discovered_ids) {
  LockGuard guard(m_mtx_);

  for (auto iter = m_owner_map_.begin(); iter != m_owner_map_.end();) {
    if (!discovered_ids.contains(iter->first)) {
      MICRODP_INFO("Releasing device {} which disappeared from the node",
                   iter->first);
      // erase() of flat_hash_map doesn't return the next iterator.
      m_owner_map_.erase(iter++);
    } else {
      ++iter;
    }
  }
}

absl::flat_hash_map<std::string, std::string> DeviceAllocator::Snapshot() {
  LockGuard guard(m_mtx_);
  return m_owner_map_;
}

std::vector<std::string> DeviceAllocator::GetAllocatedDevices() {
  LockGuard guard(m_mtx_);

  std::vector<std::string> ids;
  ids.reserve(m_owner_map_.size());
  for (auto&& [id, owner] : m_owner_map_) ids.emplace_back(id);
  return ids;
}

}  // namespace Dp
