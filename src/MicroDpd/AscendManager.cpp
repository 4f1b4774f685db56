#include "AscendManager.h"

#include <fmt/format.h>

#include <boost/algorithm/string/join.hpp>
#include <regex>

namespace Dp {

AscendManager::AscendManager(std::unique_ptr<ICommandRunner> runner,
                             absl::Duration cache_ttl)
    : CachedDeviceManager(cache_ttl), m_runner_(std::move(runner)) {}

MicrodpErr AscendManager::DiscoverDevicesNoCache_(
    std::vector<Device>* devices) {
  MICRODP_INFO("Discovering Huawei devices");

  util::CommandResult result;
  MicrodpErr err = m_runner_->Run({"info", "-l"}, &result);
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to enumerate Huawei NPUs: {}", result.output);
    return err;
  }

  //  NPU ID                         : 0
  static const std::regex re(R"(NPU ID\s*:\s*(\d+))");
  for (auto it = std::sregex_iterator(result.output.begin(),
                                      result.output.end(), re);
       it != std::sregex_iterator(); ++it) {
    Device device;
    device.id = (*it)[1].str();
    device.index = device.id;
    device.physical_id = device.id;
    device.healthy = true;
    device.vendor = "huawei";
    device.device_path = fmt::format("/dev/davinci{}", device.id);

    MICRODP_DEBUG("Huawei device: ID={}", device.id);
    devices->emplace_back(std::move(device));
  }

  return MicrodpErr::kOk;
}

bool AscendManager::CheckDeviceHealth_(const Device& device) {
  util::CommandResult result;
  MicrodpErr err =
      m_runner_->Run({"info", "-t", "health", "-i", device.index}, &result);
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to check health of Huawei device {}", device.id);
    return false;
  }

  //  Health Status                  : OK
  static const std::regex re(R"(Health Status\s*:\s*(\S+))");
  std::smatch match;
  if (!std::regex_search(result.output, match, re)) return false;

  std::string status = match[1].str();
  MICRODP_TRACE("Huawei device {} health status: {}", device.id, status);
  return status == "OK" || status == "Warning";
}

void AscendManager::BuildContainerResponse(
    const std::vector<Device>& devices,
    v1beta1::ContainerAllocateResponse* response) const {
  std::vector<std::string> ids;
  for (auto&& d : devices) ids.emplace_back(d.id);

  (*response->mutable_envs())["ASCEND_VISIBLE_DEVICES"] = boost::join(ids, ",");

  auto add_device = [response](const std::string& path) {
    v1beta1::DeviceSpec* spec = response->add_devices();
    spec->set_container_path(path);
    spec->set_host_path(path);
    spec->set_permissions("rwm");
  };

  for (auto&& d : devices) add_device(d.device_path);
  for (const char* path :
       {"/dev/davinci_manager", "/dev/devmm_svm", "/dev/hisi_hdc"})
    add_device(path);
}

}  // namespace Dp
