#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Dp {

struct PartitionProfile {
  std::string name;  // e.g. "3g.20gb"
  uint32_t profile_id;
};

struct GpuInstanceRow {
  std::string gpu;
  std::string profile_name;
  uint32_t profile_id;
  uint32_t instance_id;
};

struct ComputeInstanceRow {
  std::string gpu;
  uint32_t gpu_instance_id;
  std::string profile_name;
  uint32_t profile_id;
  uint32_t instance_id;
};

// One row of `--query-gpu=index,uuid,memory.total,mig.mode.current`.
struct GpuRow {
  std::string index;
  std::string uuid;
  std::string memory_total;
  std::string mig_mode;
};

/**
 * Memory requirement in MB of a partition profile like "3g.20gb" or "1g.5g".
 * @return 0 if the profile can't be parsed.
 */
uint64_t ParseProfileMemoryMb(std::string_view profile);

// floor(total / requirement). 0 if the requirement is 0.
uint32_t MaxInstanceCount(uint64_t total_memory_mb,
                          uint64_t profile_memory_mb);

// `requested` clamped to `max_instances`. 0 requested means the maximum.
uint32_t EffectiveInstanceCount(uint32_t requested, uint32_t max_instances);

// True if the output is one of the messages nvidia-smi prints when there is
// nothing to list. Such output is not an error even with a nonzero exit code.
bool IsEmptyListingOutput(const std::string& output);

std::vector<GpuRow> ParseGpuQueryCsv(const std::string& output);

// Every run of digits in the output of `--query-gpu=index`.
std::vector<std::string> ParseGpuIndexes(const std::string& output);

// Leading unsigned integer of a csv value like "81920" or "81920 MiB".
std::optional<uint64_t> ParseLeadingNumber(std::string_view value);

std::vector<PartitionProfile> ParseGpuInstanceProfiles(
    const std::string& output);

std::vector<GpuInstanceRow> ParseGpuInstances(const std::string& output);

std::vector<ComputeInstanceRow> ParseComputeInstances(
    const std::string& output);

// "unknown" if the id is not in the table.
std::string ProfileNameOf(const std::vector<PartitionProfile>& profiles,
                          uint32_t profile_id);

std::optional<uint32_t> ProfileIdOf(
    const std::vector<PartitionProfile>& profiles, std::string_view name);

}  // namespace Dp
