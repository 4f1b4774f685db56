#pragma once

#include <list>
#include <string>

#include "microdp/PublicHeader.h"
#include "microdp/Subprocess.h"

namespace Dp {

/**
 * Runs the command line tool of a vendor. Every query the managers issue
 * goes through this interface so that tests can replay recorded output.
 */
class ICommandRunner {
 public:
  virtual ~ICommandRunner() = default;

  /***
   * @param args arguments passed to the tool, the tool path excluded.
   * @param[out] result exit code and combined output. Filled whenever the
   * tool was started.
   */
  virtual MicrodpErr Run(const std::list<std::string>& args,
                         util::CommandResult* result) = 0;
};

class ToolCommandRunner : public ICommandRunner {
 public:
  ToolCommandRunner(std::string tool_path, std::list<std::string> extra_env);

  MicrodpErr Run(const std::list<std::string>& args,
                 util::CommandResult* result) override;

 private:
  std::string m_tool_path_;
  std::list<std::string> m_extra_env_;
};

// The driver libraries of the host are mounted at /host-lib.
std::list<std::string> DriverToolEnv();

}  // namespace Dp
