#include "microdp/String.h"

namespace util {

std::string ReadableMemoryMb(uint64_t memory_mb) {
  if (memory_mb < 1024)
    return fmt::format("{}M", memory_mb);
  else if (memory_mb < 1024 * 1024)
    return fmt::format("{}G", memory_mb / 1024);
  else
    return fmt::format("{}T", memory_mb / 1024 / 1024);
}

std::vector<std::string> SplitNonEmptyLines(const std::string &text) {
  std::vector<std::string> raw_lines;
  std::vector<std::string> lines;

  boost::split(raw_lines, text, boost::is_any_of("\n"));
  for (auto &line : raw_lines) {
    boost::trim(line);
    if (!line.empty()) lines.emplace_back(std::move(line));
  }

  return lines;
}

bool ContainsAnyOf(const std::string &text,
                   std::initializer_list<std::string_view> phrases) {
  for (const auto &phrase : phrases) {
    if (text.find(phrase) != std::string::npos) return true;
  }
  return false;
}

}  // namespace util
