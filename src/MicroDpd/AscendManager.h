#pragma once

#include <memory>

#include "CommandRunner.h"
#include "DeviceManager.h"

namespace Dp {

// Huawei Ascend NPUs, queried through npu-smi.
class AscendManager : public CachedDeviceManager {
 public:
  explicit AscendManager(std::unique_ptr<ICommandRunner> runner,
                         absl::Duration cache_ttl = kDiscoveryCacheTtl);

  std::string_view Vendor() const override { return "huawei"; }

  std::string_view VisibleDevicesEnv() const override {
    return "ASCEND_VISIBLE_DEVICES";
  }

  void BuildContainerResponse(
      const std::vector<Device>& devices,
      v1beta1::ContainerAllocateResponse* response) const override;

 protected:
  MicrodpErr DiscoverDevicesNoCache_(std::vector<Device>* devices) override;

  bool CheckDeviceHealth_(const Device& device) override;

 private:
  std::unique_ptr<ICommandRunner> m_runner_;
};

}  // namespace Dp
