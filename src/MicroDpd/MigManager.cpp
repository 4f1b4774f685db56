#include "MigManager.h"

#include <absl/time/clock.h>
#include <fmt/format.h>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "microdp/String.h"

namespace Dp {

MigManager::MigManager(ICommandRunner* runner, Config::MigConf conf,
                       absl::Duration release_pause)
    : m_runner_(runner),
      m_conf_(std::move(conf)),
      m_release_pause_(release_pause) {}

std::vector<PartitionProfile> MigManager::ListProfiles() {
  util::CommandResult result;
  MicrodpErr err = m_runner_->Run({"mig", "-lgip"}, &result);
  if (err != MicrodpErr::kOk) {
    MICRODP_WARN("Failed to list MIG profiles. Profile names are unknown.");
    return {};
  }

  return ParseGpuInstanceProfiles(result.output);
}

MicrodpErr MigManager::DiscoverPartitions(
    const std::string& gpu_index, const std::vector<PartitionProfile>& profiles,
    std::vector<Device>* devices) {
  util::CommandResult gi_result;
  MicrodpErr err = m_runner_->Run({"mig", "-lgi", "-i", gpu_index}, &gi_result);

  if (IsEmptyListingOutput(gi_result.output)) {
    MICRODP_INFO("No MIG GPU instances found on GPU {}", gpu_index);
    return MicrodpErr::kOk;
  }
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to query GPU instances of GPU {}", gpu_index);
    return MicrodpErr::kCommandFailure;
  }

  for (auto&& gi : ParseGpuInstances(gi_result.output)) {
    std::string gi_id = std::to_string(gi.instance_id);

    util::CommandResult ci_result;
    err = m_runner_->Run({"mig", "-lci", "-i", gpu_index, "-gi", gi_id},
                         &ci_result);
    if (IsEmptyListingOutput(ci_result.output)) {
      MICRODP_DEBUG("No compute instance in GPU instance {} of GPU {}", gi_id,
                    gpu_index);
      continue;
    }
    if (err != MicrodpErr::kOk) {
      MICRODP_ERROR("Failed to query compute instances of GI {} on GPU {}",
                    gi_id, gpu_index);
      continue;
    }

    for (auto&& ci : ParseComputeInstances(ci_result.output)) {
      if (ci.gpu_instance_id != gi.instance_id) continue;

      Device device;
      device.id = fmt::format("{}-GI{}-CI{}", gpu_index, gi_id, ci.instance_id);
      device.index = gi_id;
      device.physical_id = gpu_index;
      device.is_partition = true;
      device.profile = ProfileNameOf(profiles, gi.profile_id);
      device.healthy = true;
      device.vendor = "nvidia";
      device.device_path = fmt::format("/dev/nvidia{}", gpu_index);

      devices->emplace_back(std::move(device));
    }
  }

  return MicrodpErr::kOk;
}

MicrodpErr MigManager::Reconcile() {
  if (!m_conf_.Enabled) {
    MICRODP_INFO("MIG configuration is disabled.");
    return MicrodpErr::kOk;
  }

  MICRODP_INFO("Starting MIG configuration with profile {}", m_conf_.Profile);

  uint64_t profile_memory_mb = ParseProfileMemoryMb(m_conf_.Profile);
  if (profile_memory_mb == 0) {
    MICRODP_ERROR("Invalid MIG profile \"{}\". Every GPU is skipped.",
                  m_conf_.Profile);
    return MicrodpErr::kPartitionConfigFailure;
  }

  bool supported;
  std::string profile_table;
  MicrodpErr err = ProbeSupport_(&supported, &profile_table);
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to check MIG support.");
    return MicrodpErr::kPartitionConfigFailure;
  }
  if (!supported) {
    MICRODP_WARN("MIG is not supported on this node. Skipping MIG setup.");
    return MicrodpErr::kOk;
  }

  std::vector<PartitionProfile> profiles =
      ParseGpuInstanceProfiles(profile_table);

  util::CommandResult result;
  err = m_runner_->Run({"--query-gpu=index", "--format=csv,noheader"}, &result);
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to list GPU indexes.");
    return MicrodpErr::kPartitionConfigFailure;
  }

  for (auto&& index : ParseGpuIndexes(result.output)) {
    err = ReconfigureGpu_(index, profile_memory_mb, profiles);
    if (err != MicrodpErr::kOk)
      MICRODP_ERROR("MIG setup of GPU {} failed: {}. Skipping it.", index,
                    MicrodpErrStr(err));
  }

  return MicrodpErr::kOk;
}

MicrodpErr MigManager::ProbeSupport_(bool* supported,
                                     std::string* profile_table) {
  util::CommandResult result;
  MicrodpErr err = m_runner_->Run({"mig", "-lgip"}, &result);

  if (util::ContainsAnyOf(result.output, {"No MIG-supported devices found",
                                          "not supported", "Not Supported"})) {
    MICRODP_DEBUG("MIG not supported: {}", result.output);
    *supported = false;
    return MicrodpErr::kOk;
  }
  if (err != MicrodpErr::kOk) return err;

  *supported = result.output.find("MIG") != std::string::npos;
  *profile_table = std::move(result.output);
  return MicrodpErr::kOk;
}

MicrodpErr MigManager::EnsureMigMode_(const std::string& gpu_index) {
  util::CommandResult result;
  MicrodpErr err = m_runner_->Run(
      {"-i", gpu_index, "--query-gpu=mig.mode.current", "--format=csv,noheader"},
      &result);
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to check MIG mode of GPU {}", gpu_index);
    return MicrodpErr::kPartitionConfigFailure;
  }

  if (boost::trim_copy(result.output) == "Enabled") {
    MICRODP_INFO("GPU {} is already in MIG mode.", gpu_index);
    return MicrodpErr::kOk;
  }

  err = m_runner_->Run({"-i", gpu_index, "-mig", "1"}, &result);
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to enable MIG mode on GPU {}: {}", gpu_index,
                  result.output);
    return MicrodpErr::kPartitionConfigFailure;
  }

  MICRODP_INFO("Enabled MIG mode on GPU {}", gpu_index);
  return MicrodpErr::kOk;
}

MicrodpErr MigManager::CountGpuInstances_(const std::string& gpu_index,
                                          size_t* count) {
  util::CommandResult result;
  MicrodpErr err = m_runner_->Run({"mig", "-lgi", "-i", gpu_index}, &result);

  if (IsEmptyListingOutput(result.output)) {
    *count = 0;
    return MicrodpErr::kOk;
  }
  if (err != MicrodpErr::kOk) return MicrodpErr::kPartitionConfigFailure;

  *count = ParseGpuInstances(result.output).size();
  return MicrodpErr::kOk;
}

void MigManager::DestroyInstances_(const std::string& gpu_index) {
  util::CommandResult result;

  // Compute instances live inside GPU instances and must go first.
  MicrodpErr err = m_runner_->Run({"mig", "-i", gpu_index, "-dci"}, &result);
  if (err != MicrodpErr::kOk && !IsEmptyListingOutput(result.output))
    MICRODP_WARN("Failed to destroy compute instances on GPU {}: {}",
                 gpu_index, result.output);

  err = m_runner_->Run({"mig", "-i", gpu_index, "-dgi"}, &result);
  if (err != MicrodpErr::kOk && !IsEmptyListingOutput(result.output))
    MICRODP_WARN("Failed to destroy GPU instances on GPU {}: {}", gpu_index,
                 result.output);

  absl::SleepFor(m_release_pause_);
}

MicrodpErr MigManager::ReconfigureGpu_(
    const std::string& gpu_index, uint64_t profile_memory_mb,
    const std::vector<PartitionProfile>& profiles) {
  MicrodpErr err = EnsureMigMode_(gpu_index);
  if (err != MicrodpErr::kOk) return err;

  size_t existing;
  err = CountGpuInstances_(gpu_index, &existing);
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to count MIG instances of GPU {}", gpu_index);
    return err;
  }

  if (existing > 0) {
    if (m_conf_.SkipConfigured) {
      MICRODP_INFO("Skipping GPU {} which already has {} MIG instance(s).",
                   gpu_index, existing);
      return MicrodpErr::kOk;
    }

    MICRODP_INFO("Destroying {} existing MIG instance(s) on GPU {}", existing,
                 gpu_index);
    DestroyInstances_(gpu_index);
  }

  util::CommandResult result;
  err = m_runner_->Run({"-i", gpu_index, "--query-gpu=memory.total",
                        "--format=csv,noheader,nounits"},
                       &result);
  std::optional<uint64_t> total_memory_mb;
  if (err == MicrodpErr::kOk) total_memory_mb = ParseLeadingNumber(result.output);
  if (!total_memory_mb) {
    MICRODP_ERROR("Failed to read the memory size of GPU {}", gpu_index);
    return MicrodpErr::kPartitionConfigFailure;
  }

  uint32_t max_instances =
      MaxInstanceCount(total_memory_mb.value(), profile_memory_mb);
  if (max_instances == 0) {
    MICRODP_WARN("GPU {} with {} of memory can't hold one {} instance.",
                 gpu_index, util::ReadableMemoryMb(total_memory_mb.value()),
                 m_conf_.Profile);
    return MicrodpErr::kOk;
  }

  uint32_t count = EffectiveInstanceCount(m_conf_.InstanceCount, max_instances);
  if (m_conf_.InstanceCount > max_instances)
    MICRODP_WARN("{} {} instances requested but GPU {} holds at most {}.",
                 m_conf_.InstanceCount, m_conf_.Profile, gpu_index,
                 max_instances);

  std::optional<uint32_t> profile_id = ProfileIdOf(profiles, m_conf_.Profile);
  if (!profile_id) {
    MICRODP_ERROR("MIG profile {} is not offered by GPU {}", m_conf_.Profile,
                  gpu_index);
    return MicrodpErr::kPartitionConfigFailure;
  }

  std::vector<std::string> ids(count, std::to_string(profile_id.value()));

  MICRODP_INFO("Creating {} MIG instance(s) of {} on GPU {}", count,
               m_conf_.Profile, gpu_index);
  err = m_runner_->Run(
      {"mig", "-i", gpu_index, "-cgi", boost::join(ids, ","), "-C"}, &result);
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to create MIG instances on GPU {}: {}", gpu_index,
                  result.output);
    return MicrodpErr::kPartitionConfigFailure;
  }

  return MicrodpErr::kOk;
}

}  // namespace Dp
