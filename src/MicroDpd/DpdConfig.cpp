#include "DpdConfig.h"

#include <absl/strings/numbers.h>

#include <algorithm>
#include <cstdlib>

namespace Dp {

namespace {

bool EnvIsTrue(const char *value) { return std::string_view(value) == "true"; }

}  // namespace

MicrodpErr ParseConfigNode(const YAML::Node &node, Config *config) {
  try {
    if (node["DebugLevel"])
      config->DebugLevel = node["DebugLevel"].as<std::string>();

    if (node["LogFile"]) config->LogFile = node["LogFile"].as<std::string>();

    if (node["Vendors"])
      config->Vendors = node["Vendors"].as<std::vector<std::string>>();

    if (node["HealthPort"])
      config->HealthPort = node["HealthPort"].as<uint16_t>();

    if (node["PodResourcesSocket"])
      config->PodResourcesSocket = node["PodResourcesSocket"].as<std::string>();

    if (node["NvidiaSmiPath"])
      config->NvidiaSmiPath = node["NvidiaSmiPath"].as<std::string>();

    if (node["NpuSmiPath"])
      config->NpuSmiPath = node["NpuSmiPath"].as<std::string>();

    if (node["SimulatorFailureRate"])
      config->SimulatorFailureRate =
          node["SimulatorFailureRate"].as<double>();

    if (const YAML::Node &mig = node["Mig"]) {
      if (mig["Enabled"]) config->Mig.Enabled = mig["Enabled"].as<bool>();
      if (mig["Profile"]) config->Mig.Profile = mig["Profile"].as<std::string>();
      if (mig["InstanceCount"])
        config->Mig.InstanceCount = mig["InstanceCount"].as<uint32_t>();
      if (mig["SkipConfigured"])
        config->Mig.SkipConfigured = mig["SkipConfigured"].as<bool>();
    }

    if (const YAML::Node &cdi = node["Cdi"]) {
      if (cdi["Enabled"]) config->Cdi.Enabled = cdi["Enabled"].as<bool>();
      if (cdi["Prefix"]) config->Cdi.Prefix = cdi["Prefix"].as<std::string>();
    }
  } catch (YAML::Exception &e) {
    MICRODP_ERROR("Invalid value in config: {}", e.what());
    return MicrodpErr::kInvalidParam;
  }

  return MicrodpErr::kOk;
}

MicrodpErr ApplyEnvOverrides(Config *config) {
  if (const char *v = std::getenv("ENABLE_MIG"))
    config->Mig.Enabled = EnvIsTrue(v);

  if (const char *v = std::getenv("MIG_PROFILE"); v && *v)
    config->Mig.Profile = v;

  if (const char *v = std::getenv("MIG_INSTANCE_COUNT"); v && *v) {
    uint32_t count;
    if (!absl::SimpleAtoi(v, &count)) {
      MICRODP_ERROR("Illegal MIG_INSTANCE_COUNT \"{}\"", v);
      return MicrodpErr::kInvalidParam;
    }
    config->Mig.InstanceCount = count;
  }

  if (const char *v = std::getenv("SKIP_CONFIGURED"))
    config->Mig.SkipConfigured = EnvIsTrue(v);

  if (const char *v = std::getenv("NVIDIA_SMI_PATH"); v && *v)
    config->NvidiaSmiPath = v;

  if (const char *v = std::getenv("CDI_ENABLED"))
    config->Cdi.Enabled = EnvIsTrue(v);

  if (const char *v = std::getenv("CDI_PREFIX"); v && *v)
    config->Cdi.Prefix = v;

  return MicrodpErr::kOk;
}

MicrodpErr ValidateConfig(const Config &config) {
  static const std::vector<std::string> kLevels{"trace", "debug", "info",
                                                "warn", "error"};
  static const std::vector<std::string> kVendors{"nvidia", "huawei",
                                                 "simulator"};

  if (std::find(kLevels.begin(), kLevels.end(), config.DebugLevel) ==
      kLevels.end()) {
    MICRODP_ERROR("Illegal debug-level \"{}\".", config.DebugLevel);
    return MicrodpErr::kInvalidParam;
  }

  if (config.Vendors.empty()) {
    MICRODP_ERROR("No vendor is configured.");
    return MicrodpErr::kInvalidParam;
  }

  for (auto &&vendor : config.Vendors) {
    if (std::find(kVendors.begin(), kVendors.end(), vendor) == kVendors.end()) {
      MICRODP_ERROR("Unknown vendor \"{}\".", vendor);
      return MicrodpErr::kInvalidParam;
    }
  }

  return MicrodpErr::kOk;
}

}  // namespace Dp
