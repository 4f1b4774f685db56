#pragma once

#include <absl/synchronization/notification.h>

#include <string>
#include <vector>

#include "DeviceAllocator.h"
#include "DpdPublicDefs.h"
#include "WorkloadResolver.h"

namespace Dp {

/**
 * Releases allocations whose owner is unknown or no longer running. kubelet
 * never tells a device plugin that a container is gone, so without this the
 * allocator would only ever grow.
 */
class ResourceRecycler {
 public:
  ResourceRecycler(DeviceAllocator* allocator, IWorkloadResolver* resolver);

  // One scan. Returns the released device ids.
  std::vector<std::string> RecycleOnce();

  void RecycleLoop(const absl::Notification& cancel,
                   absl::Duration interval = kRecycleInterval);

 private:
  DeviceAllocator* m_allocator_;
  IWorkloadResolver* m_resolver_;
};

}  // namespace Dp
