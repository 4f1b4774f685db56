#pragma once

#include <gmock/gmock.h>

#include <atomic>
#include <list>
#include <string>
#include <vector>

#include "CommandRunner.h"
#include "DeviceManager.h"
#include "WorkloadResolver.h"

class MockCommandRunner : public Dp::ICommandRunner {
 public:
  MOCK_METHOD(MicrodpErr, Run,
              (const std::list<std::string>& args,
               util::CommandResult* result),
              (override));
};

class MockWorkloadResolver : public Dp::IWorkloadResolver {
 public:
  MOCK_METHOD(std::string, ResolveWorkloadIdentity,
              (const std::vector<std::string>& device_ids), (override));
  MOCK_METHOD(bool, IsWorkloadActive, (const std::string& identity),
              (override));
};

// Action for MockCommandRunner::Run replaying a recorded tool output.
inline auto ToolOutput(std::string output, int exit_code = 0) {
  return [output = std::move(output), exit_code](
             const std::list<std::string>&, util::CommandResult* result) {
    result->exit_code = exit_code;
    result->output = output;
    return exit_code == 0 ? MicrodpErr::kOk : MicrodpErr::kCommandFailure;
  };
}

// Devices and their health are set by the test.
class FakeDeviceManager : public Dp::IDeviceManager {
 public:
  std::string_view Vendor() const override { return "nvidia"; }

  MicrodpErr DiscoverDevices(std::vector<Dp::Device>* devices) override {
    discover_calls++;
    if (fail_discovery) return MicrodpErr::kDiscoveryFailure;
    *devices = this->devices;
    return MicrodpErr::kOk;
  }

  bool CheckHealth(const std::string& device_id) override {
    for (auto&& id : unhealthy)
      if (id == device_id) return false;
    return true;
  }

  std::string_view VisibleDevicesEnv() const override {
    return "NVIDIA_VISIBLE_DEVICES";
  }

  void BuildContainerResponse(
      const std::vector<Dp::Device>& devices,
      v1beta1::ContainerAllocateResponse* response) const override {
    for (auto&& d : devices) {
      v1beta1::DeviceSpec* spec = response->add_devices();
      spec->set_host_path(d.device_path);
      spec->set_container_path(d.device_path);
      spec->set_permissions("rwm");
    }
  }

  static Dp::Device MakeDevice(const std::string& id) {
    Dp::Device device;
    device.id = id;
    device.index = id;
    device.physical_id = id;
    device.vendor = "nvidia";
    device.device_path = "/dev/nvidia" + id;
    return device;
  }

  std::vector<Dp::Device> devices;
  std::vector<std::string> unhealthy;
  bool fail_discovery{false};
  std::atomic_int discover_calls{0};
};
