#include "microdp/Subprocess.h"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/algorithm/string/join.hpp>
#include <cerrno>
#include <cstring>
#include <vector>

extern char** environ;

namespace util {

namespace {

std::string EnvKey(const std::string& entry) {
  return entry.substr(0, entry.find('='));
}

}  // namespace

MicrodpErr RunCommand(const std::string& exec_path,
                      const std::list<std::string>& args,
                      const std::list<std::string>& extra_env,
                      CommandResult* result) {
  // Prepare argv and envp before fork(). Only async-signal-safe calls are
  // allowed in the child of a multi-threaded process.
  std::vector<const char*> argv;
  argv.push_back(exec_path.c_str());
  for (auto&& arg : args) argv.push_back(arg.c_str());
  argv.push_back(nullptr);

  std::list<std::string> env_entries;
  for (char** env = environ; env && *env; env++) {
    std::string entry{*env};
    bool overridden = false;
    for (auto&& extra : extra_env) {
      if (EnvKey(extra) == EnvKey(entry)) {
        overridden = true;
        break;
      }
    }
    if (!overridden) env_entries.emplace_back(std::move(entry));
  }
  for (auto&& extra : extra_env) env_entries.emplace_back(extra);

  std::vector<const char*> envp;
  for (auto&& entry : env_entries) envp.push_back(entry.c_str());
  envp.push_back(nullptr);

  int pipe_fds[2];
  if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
    MICRODP_ERROR("Failed to create pipe for {}: {}", exec_path,
                  strerror(errno));
    return MicrodpErr::kSystemErr;
  }

  MICRODP_TRACE("Executing {} {}", exec_path, boost::algorithm::join(args, " "));

  pid_t child_pid = fork();
  if (child_pid < 0) {
    MICRODP_ERROR("Failed to fork for {}: {}", exec_path, strerror(errno));
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    return MicrodpErr::kSystemErr;
  }

  if (child_pid == 0) {  // Child proc
    dup2(pipe_fds[1], STDOUT_FILENO);  // stdout -> pipe
    dup2(pipe_fds[1], STDERR_FILENO);  // stderr -> pipe

    execve(exec_path.c_str(), const_cast<char* const*>(argv.data()),
           const_cast<char* const*>(envp.data()));

    // execve() returned. 127 is what shells use for "command not found".
    _exit(127);
  }

  // Parent proc
  close(pipe_fds[1]);

  result->output.clear();
  char buf[4096];
  while (true) {
    ssize_t n = read(pipe_fds[0], buf, sizeof(buf));
    if (n > 0) {
      result->output.append(buf, n);
    } else if (n == 0) {
      break;
    } else if (errno != EINTR) {
      MICRODP_ERROR("Failed to read output of {}: {}", exec_path,
                    strerror(errno));
      break;
    }
  }
  close(pipe_fds[0]);

  int status;
  pid_t r;
  do {
    r = waitpid(child_pid, &status, 0);
  } while (r < 0 && errno == EINTR);

  if (r < 0) {
    MICRODP_ERROR("waitpid() error for {}: {}", exec_path, strerror(errno));
    return MicrodpErr::kSystemErr;
  }

  if (WIFEXITED(status)) {
    result->exit_code = WEXITSTATUS(status);
  } else {
    result->exit_code = -1;
  }

  if (result->exit_code == 127 && result->output.empty()) {
    MICRODP_DEBUG("{} could not be executed", exec_path);
    return MicrodpErr::kSystemErr;
  }

  return result->exit_code == 0 ? MicrodpErr::kOk
                                : MicrodpErr::kCommandFailure;
}

}  // namespace util
