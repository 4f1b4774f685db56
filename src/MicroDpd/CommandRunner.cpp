#include "CommandRunner.h"

#include <boost/algorithm/string/join.hpp>

namespace Dp {

ToolCommandRunner::ToolCommandRunner(std::string tool_path,
                                     std::list<std::string> extra_env)
    : m_tool_path_(std::move(tool_path)), m_extra_env_(std::move(extra_env)) {}

MicrodpErr ToolCommandRunner::Run(const std::list<std::string>& args,
                                  util::CommandResult* result) {
  MicrodpErr err = util::RunCommand(m_tool_path_, args, m_extra_env_, result);
  if (err == MicrodpErr::kSystemErr) {
    MICRODP_ERROR("Failed to start {}", m_tool_path_);
  } else if (err != MicrodpErr::kOk) {
    MICRODP_DEBUG("{} {} exited with code {}. Output: {}", m_tool_path_,
                  boost::join(args, " "), result->exit_code, result->output);
  }

  return err;
}

std::list<std::string> DriverToolEnv() {
  return {
      "LD_LIBRARY_PATH=/usr/lib/x86_64-linux-gnu:/host-lib",
      "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin",
  };
}

}  // namespace Dp
