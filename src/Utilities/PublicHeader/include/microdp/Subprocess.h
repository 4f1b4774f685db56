#pragma once

#include <list>
#include <string>

#include "microdp/PublicHeader.h"

namespace util {

struct CommandResult {
  // -1 if the child was terminated by a signal.
  int exit_code{-1};

  // stdout and stderr of the child, interleaved as written.
  std::string output;
};

/***
 * Run an executable synchronously and collect its combined output.
 * @param exec_path the absolute path of the executable.
 * @param args the arguments, argv[0] excluded.
 * @param extra_env "KEY=VALUE" entries appended to the environment inherited
 * from this process. Later entries win.
 * @param[out] result the exit code and output of the child.
 * @return kOk if the child exited with 0. kCommandFailure if the child ran but
 * exited with a nonzero code or was killed; result is still filled in this
 * case. kSystemErr if the pipe, fork or exec failed.
 */
MicrodpErr RunCommand(const std::string& exec_path,
                      const std::list<std::string>& args,
                      const std::list<std::string>& extra_env,
                      CommandResult* result);

}  // namespace util
