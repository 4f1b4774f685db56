#pragma once

#include <absl/time/time.h>

#include <string>
#include <vector>

#include "CommandRunner.h"
#include "DpdPublicDefs.h"
#include "NvidiaSmiParser.h"

namespace Dp {

/**
 * Reads and rewrites the MIG layout of the GPUs on this node through
 * nvidia-smi. Holds no state of its own besides the configuration, so every
 * call reflects what the driver reports at that moment.
 */
class MigManager {
 public:
  MigManager(ICommandRunner* runner, Config::MigConf conf,
             absl::Duration release_pause = kPartitionReleasePause);

  /**
   * Append one Device per compute instance of a GPU in MIG mode.
   * A GPU instance whose compute instances can't be listed is skipped.
   * @return kCommandFailure if the GPU instances can't be listed.
   */
  MicrodpErr DiscoverPartitions(const std::string& gpu_index,
                                const std::vector<PartitionProfile>& profiles,
                                std::vector<Device>* devices);

  // `mig -lgip`. An empty table is returned on failure.
  std::vector<PartitionProfile> ListProfiles();

  /**
   * Bring every GPU to `conf.InstanceCount` instances of `conf.Profile`.
   * Does nothing if MIG is disabled in the configuration or not supported by
   * the hardware. A GPU which fails is logged and skipped.
   * @return kPartitionConfigFailure if the pass could not start at all.
   */
  MicrodpErr Reconcile();

 private:
  MicrodpErr ProbeSupport_(bool* supported, std::string* profile_table);

  MicrodpErr ReconfigureGpu_(const std::string& gpu_index,
                             uint64_t profile_memory_mb,
                             const std::vector<PartitionProfile>& profiles);

  MicrodpErr EnsureMigMode_(const std::string& gpu_index);

  MicrodpErr CountGpuInstances_(const std::string& gpu_index, size_t* count);

  void DestroyInstances_(const std::string& gpu_index);

  ICommandRunner* m_runner_;
  Config::MigConf m_conf_;
  absl::Duration m_release_pause_;
};

}  // namespace Dp
