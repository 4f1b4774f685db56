#pragma once

#include <memory>

#include "CommandRunner.h"
#include "DeviceManager.h"
#include "MigManager.h"

namespace Dp {

class NvidiaManager : public CachedDeviceManager,
                      public IPartitionConfigurator {
 public:
  NvidiaManager(std::unique_ptr<ICommandRunner> runner,
                const Config::MigConf& mig_conf,
                absl::Duration cache_ttl = kDiscoveryCacheTtl,
                absl::Duration release_pause = kPartitionReleasePause);

  std::string_view Vendor() const override { return "nvidia"; }

  std::string_view VisibleDevicesEnv() const override {
    return "NVIDIA_VISIBLE_DEVICES";
  }

  IPartitionConfigurator* PartitionConfigurator() override { return this; }

  // Reconcile the MIG layout and drop the cached device list.
  MicrodpErr ConfigurePartitions() override;

  void BuildContainerResponse(
      const std::vector<Device>& devices,
      v1beta1::ContainerAllocateResponse* response) const override;

 protected:
  MicrodpErr DiscoverDevicesNoCache_(std::vector<Device>* devices) override;

  bool CheckDeviceHealth_(const Device& device) override;

 private:
  std::unique_ptr<ICommandRunner> m_runner_;
  MigManager m_mig_manager_;
};

}  // namespace Dp
