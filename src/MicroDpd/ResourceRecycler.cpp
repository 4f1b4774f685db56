#include "ResourceRecycler.h"

#include <boost/algorithm/string/join.hpp>

namespace Dp {

ResourceRecycler::ResourceRecycler(DeviceAllocator* allocator,
                                   IWorkloadResolver* resolver)
    : m_allocator_(allocator), m_resolver_(resolver) {}

std::vector<std::string> ResourceRecycler::RecycleOnce() {
  std::vector<std::string> released;

  // Work on a copy: the resolver may block and must not hold the
  // allocator lock.
  for (auto&& [device_id, owner] : m_allocator_->Snapshot()) {
    if (owner.empty()) {
      released.emplace_back(device_id);
      continue;
    }

    if (!m_resolver_->IsWorkloadActive(owner)) {
      MICRODP_INFO("Owner {} of device {} is gone.", owner, device_id);
      released.emplace_back(device_id);
    }
  }

  if (!released.empty()) {
    m_allocator_->Deallocate(released);
    MICRODP_INFO("Recycled device(s) [{}]", boost::join(released, ", "));
  }

  return released;
}

void ResourceRecycler::RecycleLoop(const absl::Notification& cancel,
                                   absl::Duration interval) {
  while (!cancel.WaitForNotificationWithTimeout(interval)) RecycleOnce();
  MICRODP_TRACE("Recycle loop exited.");
}

}  // namespace Dp
