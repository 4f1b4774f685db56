#pragma once

#include <absl/time/time.h>
#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "microdp/PublicHeader.h"

namespace Dp {

inline constexpr std::string_view kDevicePluginApiVersion = "v1beta1";
inline constexpr std::string_view kDevicePluginPath =
    "/var/lib/kubelet/device-plugins/";
inline constexpr std::string_view kKubeletSocket =
    "/var/lib/kubelet/device-plugins/kubelet.sock";
inline constexpr std::string_view kPodResourcesSocket =
    "/var/lib/kubelet/pod-resources/kubelet.sock";
inline constexpr std::string_view kPluginSocketPrefix = "microdp.sock";

inline constexpr std::string_view kHealthy = "Healthy";
inline constexpr std::string_view kUnhealthy = "Unhealthy";

inline constexpr std::string_view kResourceClass = "microgpu";

// The extended resource a vendor's devices are advertised under.
inline std::string ResourceNameOf(std::string_view vendor) {
  return fmt::format("{}.com/{}", vendor, kResourceClass);
}

constexpr absl::Duration kDiscoveryCacheTtl = absl::Minutes(5);
constexpr absl::Duration kWatchTickInterval = absl::Seconds(10);
constexpr absl::Duration kHealthCheckInterval = absl::Seconds(30);
constexpr absl::Duration kRecycleInterval = absl::Seconds(30);
constexpr absl::Duration kPartitionReleasePause = absl::Seconds(2);
constexpr absl::Duration kRegisterTimeout = absl::Seconds(10);

/**
 * One schedulable unit advertised to kubelet. Either a whole GPU or a
 * partition of one. A Device is rebuilt on every discovery and never
 * modified afterwards.
 */
struct Device {
  std::string id;

  // The index used by the vendor tool to address the device.
  std::string index;

  // Index of the whole GPU that owns this device. Equal to `index` for a
  // whole GPU.
  std::string physical_id;

  bool is_partition{false};

  // Partition size descriptor, e.g. "3g.20gb". Empty for a whole GPU.
  std::optional<std::string> profile;

  bool healthy{true};
  std::string vendor;
  std::string device_path;
};

struct Config {
  struct MigConf {
    bool Enabled{false};
    std::string Profile{"3g.20gb"};
    uint32_t InstanceCount{0};  // 0 means as many as the memory allows.
    bool SkipConfigured{false};
  };

  struct CdiConf {
    bool Enabled{false};
    std::string Prefix{"nvidia.com"};
  };

  std::string DebugLevel{"info"};
  std::string LogFile{kDefaultLogFile};

  std::vector<std::string> Vendors{"nvidia", "huawei"};
  uint16_t HealthPort{kDefaultHealthPort};

  // Empty disables the pod-resources lookup.
  std::string PodResourcesSocket{kPodResourcesSocket};

  std::string NvidiaSmiPath{"/host-driver/nvidia-smi"};
  std::string NpuSmiPath{"/usr/local/sbin/npu-smi"};

  double SimulatorFailureRate{0.1};

  MigConf Mig;
  CdiConf Cdi;
};

}  // namespace Dp
