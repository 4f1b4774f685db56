#include "NvidiaSmiParser.h"

#include <absl/strings/numbers.h>

#include <boost/algorithm/string.hpp>
#include <cctype>
#include <regex>

#include "microdp/String.h"

namespace Dp {

namespace {

const std::regex& ProfileMemoryRegex() {
  static const std::regex re(R"(^[^.]+\.(\d+)(gb|g)$)");
  return re;
}

}  // namespace

uint64_t ParseProfileMemoryMb(std::string_view profile) {
  std::string text{profile};
  std::smatch match;
  if (!std::regex_match(text, match, ProfileMemoryRegex())) return 0;

  uint32_t memory_gb;
  if (!absl::SimpleAtoi(match[1].str(), &memory_gb)) return 0;

  return uint64_t{memory_gb} * 1024;
}

uint32_t MaxInstanceCount(uint64_t total_memory_mb,
                          uint64_t profile_memory_mb) {
  if (profile_memory_mb == 0) return 0;
  return static_cast<uint32_t>(total_memory_mb / profile_memory_mb);
}

uint32_t EffectiveInstanceCount(uint32_t requested, uint32_t max_instances) {
  if (requested == 0) return max_instances;
  return std::min(requested, max_instances);
}

bool IsEmptyListingOutput(const std::string& output) {
  return util::ContainsAnyOf(
      output, {"No GPU instances found", "No compute instances found",
               "Not Found", "No devices were found", "not supported",
               "No MIG-supported devices found"});
}

std::vector<GpuRow> ParseGpuQueryCsv(const std::string& output) {
  std::vector<GpuRow> rows;

  for (auto&& line : util::SplitNonEmptyLines(output)) {
    std::vector<std::string> fields;
    boost::split(fields, line, boost::is_any_of(","));
    if (fields.size() < 4) continue;

    for (auto& field : fields) boost::trim(field);

    rows.push_back(GpuRow{fields[0], fields[1], fields[2], fields[3]});
  }

  return rows;
}

std::vector<std::string> ParseGpuIndexes(const std::string& output) {
  static const std::regex re(R"(\d+)");

  std::vector<std::string> indexes;
  for (auto it = std::sregex_iterator(output.begin(), output.end(), re);
       it != std::sregex_iterator(); ++it)
    indexes.emplace_back(it->str());

  return indexes;
}

std::optional<uint64_t> ParseLeadingNumber(std::string_view value) {
  std::string text{boost::trim_copy(std::string(value))};

  size_t digits = 0;
  while (digits < text.size() &&
         std::isdigit(static_cast<unsigned char>(text[digits])))
    digits++;
  uint64_t number;
  if (digits == 0 || !absl::SimpleAtoi(text.substr(0, digits), &number))
    return std::nullopt;

  return number;
}

std::vector<PartitionProfile> ParseGpuInstanceProfiles(
    const std::string& output) {
  // | GPU   Name             ID    Instances   Memory  ...
  // |   0  MIG 1g.10gb       19     7/7        9.50    ...
  static const std::regex re(R"(^\|\s*\d+\s+MIG\s+(\S+)\s+(\d+)\s)");

  std::vector<PartitionProfile> profiles;
  for (auto&& line : util::SplitNonEmptyLines(output)) {
    std::smatch match;
    if (!std::regex_search(line, match, re)) continue;

    uint32_t id;
    if (!absl::SimpleAtoi(match[2].str(), &id)) continue;

    bool duplicated = false;
    for (auto&& p : profiles) {
      if (p.profile_id == id) {
        duplicated = true;
        break;
      }
    }
    // Every GPU prints the same table.
    if (!duplicated) profiles.push_back({match[1].str(), id});
  }

  return profiles;
}

std::vector<GpuInstanceRow> ParseGpuInstances(const std::string& output) {
  // | GPU   Name             Profile  Instance   Placement  |
  // |   0  MIG 3g.40gb          9        2          4:4     |
  static const std::regex re(
      R"(^\|\s*(\d+)\s+MIG\s+(\S+)\s+(\d+)\s+(\d+)\s+\S+\s*\|)");

  std::vector<GpuInstanceRow> rows;
  for (auto&& line : util::SplitNonEmptyLines(output)) {
    std::smatch match;
    if (!std::regex_search(line, match, re)) continue;

    GpuInstanceRow row;
    row.gpu = match[1].str();
    row.profile_name = match[2].str();
    if (!absl::SimpleAtoi(match[3].str(), &row.profile_id) ||
        !absl::SimpleAtoi(match[4].str(), &row.instance_id))
      continue;
    rows.emplace_back(std::move(row));
  }

  return rows;
}

std::vector<ComputeInstanceRow> ParseComputeInstances(
    const std::string& output) {
  // | GPU     GPU       Name             Profile   Instance   Placement  |
  // |       Instance                       ID        ID                |
  // |   0      2       MIG 3g.40gb          2         0          0:3    |
  static const std::regex re(
      R"(^\|\s*(\d+)\s+(\d+)\s+MIG\s+(\S+)\s+(\d+)\s+(\d+)\s+\S+\s*\|)");

  std::vector<ComputeInstanceRow> rows;
  for (auto&& line : util::SplitNonEmptyLines(output)) {
    std::smatch match;
    if (!std::regex_search(line, match, re)) continue;

    ComputeInstanceRow row;
    row.gpu = match[1].str();
    row.profile_name = match[3].str();
    if (!absl::SimpleAtoi(match[2].str(), &row.gpu_instance_id) ||
        !absl::SimpleAtoi(match[4].str(), &row.profile_id) ||
        !absl::SimpleAtoi(match[5].str(), &row.instance_id))
      continue;
    rows.emplace_back(std::move(row));
  }

  return rows;
}

std::string ProfileNameOf(const std::vector<PartitionProfile>& profiles,
                          uint32_t profile_id) {
  for (auto&& p : profiles)
    if (p.profile_id == profile_id) return p.name;
  return "unknown";
}

std::optional<uint32_t> ProfileIdOf(
    const std::vector<PartitionProfile>& profiles, std::string_view name) {
  for (auto&& p : profiles)
    if (p.name == name) return p.profile_id;
  return std::nullopt;
}

}  // namespace Dp
