#pragma once

#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>
#include <string_view>

// For better logging inside lambda functions
#if defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
#define __FUNCTION__ __PRETTY_FUNCTION__
#endif

#define MICRODP_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define MICRODP_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define MICRODP_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define MICRODP_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define MICRODP_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define MICRODP_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

enum class MicrodpErr : uint16_t {
  kOk = 0,
  kGenericFailure,
  kNonExistent,
  kSystemErr,  // represent the error which sets errno
  kInvalidParam,
  kRpcFailure,
  KStreamBroken,

  kCommandFailure,
  kDiscoveryFailure,
  kAlreadyAllocated,
  kPartitionConfigFailure,

  __ERR_SIZE  // NOLINT(bugprone-reserved-identifier)
};

inline const char* kDefaultConfigPath = "/etc/microdp/config.yaml";
inline const char* kDefaultLogFile = "/tmp/microdpd.log";
inline constexpr uint16_t kDefaultHealthPort = 8080;

namespace Internal {

constexpr std::array<std::string_view, uint16_t(MicrodpErr::__ERR_SIZE)>
    MicrodpErrStrArr = {
        "Success",
        "Generic failure",
        "The object doesn't exist",
        "Linux Error",
        "Invalid Parameter",
        "RPC call failed",
        "Stream is broken",

        "External command exited with failure",
        "Device discovery failed",
        "Device already allocated",
        "Partition configuration failed",
};

}  // namespace Internal

inline std::string_view MicrodpErrStr(MicrodpErr err) {
  return Internal::MicrodpErrStrArr[uint16_t(err)];
}

namespace Internal {

struct StaticLogFormatSetter {
  StaticLogFormatSetter() { spdlog::set_pattern("[%^%L%$ %C-%m-%d %s:%#] %v"); }
};

// Set the global spdlog pattern in global variable initialization.
[[maybe_unused]] inline StaticLogFormatSetter _static_formatter_setter;

}  // namespace Internal
