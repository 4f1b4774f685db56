#include "SimulatorManager.h"

#include <fmt/format.h>

#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <random>

namespace Dp {

SimulatorManager::SimulatorManager(double failure_rate)
    : m_failure_rate_(std::clamp(failure_rate, 0.0, 1.0)) {}

MicrodpErr SimulatorManager::DiscoverDevices(std::vector<Device>* devices) {
  devices->clear();
  for (int i = 0; i < 3; i++) {
    Device device;
    device.id = std::to_string(i);
    device.index = device.id;
    device.physical_id = device.id;
    device.healthy = true;
    device.vendor = "simulator";
    device.device_path = fmt::format("/dev/sim_gpu{}", i);
    devices->emplace_back(std::move(device));
  }

  return MicrodpErr::kOk;
}

bool SimulatorManager::CheckHealth(const std::string& device_id) {
  thread_local std::mt19937 gen{std::random_device{}()};
  std::bernoulli_distribution failed(m_failure_rate_);

  bool healthy = !failed(gen);
  MICRODP_TRACE("Simulated device {} healthy: {}", device_id, healthy);
  return healthy;
}

void SimulatorManager::BuildContainerResponse(
    const std::vector<Device>& devices,
    v1beta1::ContainerAllocateResponse* response) const {
  std::vector<std::string> ids;
  for (auto&& d : devices) {
    ids.emplace_back(d.id);

    v1beta1::DeviceSpec* spec = response->add_devices();
    spec->set_container_path(d.device_path);
    spec->set_host_path(d.device_path);
    spec->set_permissions("rwm");
  }

  (*response->mutable_envs())["SIM_VISIBLE_DEVICES"] = boost::join(ids, ",");
}

}  // namespace Dp
