// Repository: Hush
// Component: ProcessRunner Implementation
// Copyright (c) 2026 RetroVue

#include "hush/media/ProcessRunner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "hush/util/Errors.hpp"

namespace hush::media {

namespace {

constexpr size_t kMaxStderrBytes = 64 * 1024;

// Exit code reported by the child when execvp fails.
constexpr int kExecFailedExit = 127;

}  // namespace

std::string FormatCommandLine(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) out.push_back(' ');
    if (arg.find_first_of(" \t'\"[];|&$") == std::string::npos && !arg.empty()) {
      out += arg;
      continue;
    }
    out.push_back('\'');
    for (char c : arg) {
      if (c == '\'') {
        out += "'\\''";
      } else {
        out.push_back(c);
      }
    }
    out.push_back('\'');
  }
  return out;
}

ProcessResult RunProcess(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw ExternalToolError("process", "empty command line");
  }
  const std::string& tool = argv.front();

  int err_pipe[2];
  if (pipe(err_pipe) != 0) {
    throw ExternalToolError(tool, std::string("pipe failed: ") + std::strerror(errno));
  }

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) c_argv.push_back(const_cast<char*>(arg.c_str()));
  c_argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    const int saved = errno;
    close(err_pipe[0]);
    close(err_pipe[1]);
    throw ExternalToolError(tool, std::string("fork failed: ") + std::strerror(saved));
  }

  if (pid == 0) {
    // Child: stderr -> pipe, stdout -> /dev/null.
    dup2(err_pipe[1], STDERR_FILENO);
    close(err_pipe[0]);
    close(err_pipe[1]);
    const int devnull = open("/dev/null", O_WRONLY);
    if (devnull >= 0) {
      dup2(devnull, STDOUT_FILENO);
      close(devnull);
    }
    execvp(c_argv[0], c_argv.data());
    const char* msg = "execvp failed\n";
    ssize_t ignored = write(STDERR_FILENO, msg, std::strlen(msg));
    (void)ignored;
    _exit(kExecFailedExit);
  }

  close(err_pipe[1]);
  ProcessResult result;
  char buf[4096];
  for (;;) {
    const ssize_t n = read(err_pipe[0], buf, sizeof(buf));
    if (n > 0) {
      result.stderr_text.append(buf, static_cast<size_t>(n));
      if (result.stderr_text.size() > kMaxStderrBytes) {
        result.stderr_text.erase(0, result.stderr_text.size() - kMaxStderrBytes);
      }
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  close(err_pipe[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw ExternalToolError(tool, std::string("waitpid failed: ") + std::strerror(errno));
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
    if (result.exit_code == kExecFailedExit && result.stderr_text == "execvp failed\n") {
      throw ExternalToolError(tool, "could not be started (not on PATH?)");
    }
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

}  // namespace hush::media
