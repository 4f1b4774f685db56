#include "NvidiaManager.h"

#include <fmt/format.h>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <set>

namespace Dp {

NvidiaManager::NvidiaManager(std::unique_ptr<ICommandRunner> runner,
                             const Config::MigConf& mig_conf,
                             absl::Duration cache_ttl,
                             absl::Duration release_pause)
    : CachedDeviceManager(cache_ttl),
      m_runner_(std::move(runner)),
      m_mig_manager_(m_runner_.get(), mig_conf, release_pause) {}

MicrodpErr NvidiaManager::ConfigurePartitions() {
  MicrodpErr err = m_mig_manager_.Reconcile();
  InvalidateCache();
  return err;
}

MicrodpErr NvidiaManager::DiscoverDevicesNoCache_(
    std::vector<Device>* devices) {
  MICRODP_INFO("Discovering NVIDIA devices");

  util::CommandResult result;
  MicrodpErr err = m_runner_->Run(
      {"--query-gpu=index,uuid,memory.total,mig.mode.current",
       "--format=csv,noheader"},
      &result);
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to enumerate NVIDIA GPUs: {}", result.output);
    return err;
  }

  std::vector<PartitionProfile> profiles;
  bool profiles_loaded = false;

  for (auto&& row : ParseGpuQueryCsv(result.output)) {
    if (row.mig_mode == "Enabled") {
      if (!profiles_loaded) {
        profiles = m_mig_manager_.ListProfiles();
        profiles_loaded = true;
      }

      err = m_mig_manager_.DiscoverPartitions(row.index, profiles, devices);
      if (err != MicrodpErr::kOk)
        MICRODP_ERROR("Failed to discover MIG devices of GPU {}. Skipping it.",
                      row.index);
      continue;
    }

    Device device;
    device.id = row.uuid;
    device.index = row.index;
    device.physical_id = row.index;
    device.is_partition = false;
    device.healthy = true;
    device.vendor = "nvidia";
    device.device_path = fmt::format("/dev/nvidia{}", row.index);
    devices->emplace_back(std::move(device));
  }

  for (auto&& d : *devices)
    MICRODP_DEBUG("NVIDIA device: ID={}, Index={}, MIG={}, Profile={}", d.id,
                  d.index, d.is_partition, d.profile.value_or(""));

  return MicrodpErr::kOk;
}

bool NvidiaManager::CheckDeviceHealth_(const Device& device) {
  // A partition is as healthy as the GPU it lives on.
  util::CommandResult result;
  MicrodpErr err = m_runner_->Run({"-i", device.physical_id,
                                   "--query-gpu=utilization.gpu",
                                   "--format=csv,noheader"},
                                  &result);
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to check health of NVIDIA device {}", device.id);
    return false;
  }

  std::string utilization = boost::trim_copy(result.output);
  if (utilization.empty()) return false;

  MICRODP_TRACE("NVIDIA device {} is healthy (utilization: {})", device.id,
                utilization);
  return true;
}

void NvidiaManager::BuildContainerResponse(
    const std::vector<Device>& devices,
    v1beta1::ContainerAllocateResponse* response) const {
  std::vector<std::string> ids;
  std::set<std::string> physical_ids;
  bool has_partition = false;
  for (auto&& d : devices) {
    ids.emplace_back(d.id);
    physical_ids.emplace(d.physical_id);
    if (d.is_partition) has_partition = true;
  }

  auto* envs = response->mutable_envs();
  (*envs)["NVIDIA_VISIBLE_DEVICES"] = boost::join(ids, ",");
  (*envs)["NVIDIA_DRIVER_CAPABILITIES"] = "compute,utility";
  (*envs)["LD_LIBRARY_PATH"] =
      "/usr/lib/x86_64-linux-gnu:/usr/local/nvidia/lib:/usr/local/nvidia/"
      "lib64:/host-lib";
  (*envs)["PATH"] =
      "/usr/local/nvidia/bin:/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/"
      "bin:/sbin:/bin";

  auto add_device = [response](const std::string& path,
                               const std::string& permissions) {
    v1beta1::DeviceSpec* spec = response->add_devices();
    spec->set_container_path(path);
    spec->set_host_path(path);
    spec->set_permissions(permissions);
  };

  // Ordered and deduplicated: several partitions share one GPU node.
  for (auto&& physical_id : physical_ids)
    add_device(fmt::format("/dev/nvidia{}", physical_id), "rwm");

  for (const char* ctl :
       {"/dev/nvidiactl", "/dev/nvidia-uvm", "/dev/nvidia-uvm-tools",
        "/dev/nvidia-modeset"})
    add_device(ctl, "rwm");

  if (has_partition) add_device("/dev/nvidia-caps", "rw");

  v1beta1::Mount* mount = response->add_mounts();
  mount->set_container_path("/usr/local/nvidia/bin");
  mount->set_host_path("/usr/bin");
  mount->set_read_only(true);

  mount = response->add_mounts();
  mount->set_container_path("/host-lib");
  mount->set_host_path("/host-lib");
  mount->set_read_only(true);
}

}  // namespace Dp
