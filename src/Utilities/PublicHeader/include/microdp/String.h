#pragma once

#include <spdlog/fmt/fmt.h>

#include <boost/algorithm/string.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace util {

std::string ReadableMemoryMb(uint64_t memory_mb);

/**
 * Split the output of a command line tool into lines.
 * Each line is trimmed and empty lines are dropped.
 */
std::vector<std::string> SplitNonEmptyLines(const std::string &text);

// Case-sensitive search for any of the phrases inside text.
bool ContainsAnyOf(const std::string &text,
                   std::initializer_list<std::string_view> phrases);

}  // namespace util
