// Repository: Hush
// Component: ProcessRunner
// Purpose: Run a child process to completion, capturing its stderr.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_MEDIA_PROCESS_RUNNER_HPP_
#define HUSH_MEDIA_PROCESS_RUNNER_HPP_

#include <string>
#include <vector>

namespace hush::media {

struct ProcessResult {
  int exit_code = -1;       // -1 when the child did not exit normally
  int term_signal = 0;      // Non-zero when killed by a signal
  std::string stderr_text;  // Tail of stderr (bounded)
};

// argv[0] is looked up on PATH. stdout is discarded.
// Throws ExternalToolError when the process cannot be started.
ProcessResult RunProcess(const std::vector<std::string>& argv);

// Shell-style quoting for log lines only.
std::string FormatCommandLine(const std::vector<std::string>& argv);

}  // namespace hush::media

#endif  // HUSH_MEDIA_PROCESS_RUNNER_HPP_
