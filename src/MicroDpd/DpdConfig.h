#pragma once

#include <yaml-cpp/yaml.h>

#include "DpdPublicDefs.h"

namespace Dp {

/***
 * Read the keys present in `node` into `config`. Absent keys keep their
 * current value.
 * @return kInvalidParam if a value has the wrong type.
 */
MicrodpErr ParseConfigNode(const YAML::Node &node, Config *config);

/***
 * Apply ENABLE_MIG, MIG_PROFILE, MIG_INSTANCE_COUNT, SKIP_CONFIGURED,
 * NVIDIA_SMI_PATH, CDI_ENABLED and CDI_PREFIX.
 * @return kInvalidParam if MIG_INSTANCE_COUNT is not a number.
 */
MicrodpErr ApplyEnvOverrides(Config *config);

// kInvalidParam on an unknown debug level or vendor.
MicrodpErr ValidateConfig(const Config &config);

}  // namespace Dp
