#pragma once

#include "DeviceManager.h"

namespace Dp {

// Three fake GPUs for clusters without accelerators.
class SimulatorManager : public IDeviceManager {
 public:
  explicit SimulatorManager(double failure_rate);

  std::string_view Vendor() const override { return "simulator"; }

  MicrodpErr DiscoverDevices(std::vector<Device>* devices) override;

  // Fails randomly with the configured probability.
  bool CheckHealth(const std::string& device_id) override;

  std::string_view VisibleDevicesEnv() const override {
    return "SIM_VISIBLE_DEVICES";
  }

  void BuildContainerResponse(
      const std::vector<Device>& devices,
      v1beta1::ContainerAllocateResponse* response) const override;

 private:
  double m_failure_rate_;
};

}  // namespace Dp
