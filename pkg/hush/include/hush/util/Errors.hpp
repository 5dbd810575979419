// Repository: Hush
// Component: Error Types
// Purpose: Exception hierarchy for configuration, input, transcription and
//          external-tool failures.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_UTIL_ERRORS_HPP_
#define HUSH_UTIL_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace hush {

class HushError : public std::runtime_error {
 public:
  explicit HushError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid chunk length, unknown backend selector, malformed env values.
class ConfigError : public HushError {
 public:
  explicit ConfigError(const std::string& what)
      : HushError("ConfigError: " + what) {}
};

// Wrong channel count, empty term list at detection time.
class InvalidInputError : public HushError {
 public:
  explicit InvalidInputError(const std::string& what)
      : HushError("InvalidInputError: " + what) {}
};

// Every retry of every model failed for one chunk. Non-fatal to the run:
// the orchestrator logs it and drops the chunk.
class TranscriptionExhaustedError : public HushError {
 public:
  TranscriptionExhaustedError(int chunk_index, const std::string& last_error)
      : HushError("TranscriptionExhaustedError: chunk " +
                  std::to_string(chunk_index) +
                  " failed after retries: " + last_error),
        chunk_index_(chunk_index),
        last_error_(last_error) {}

  int ChunkIndex() const { return chunk_index_; }
  const std::string& LastError() const { return last_error_; }

 private:
  int chunk_index_;
  std::string last_error_;
};

// Probe / extraction / remux collaborator failed. Fatal to the run.
class ExternalToolError : public HushError {
 public:
  ExternalToolError(const std::string& tool, const std::string& detail,
                    int exit_code = -1, const std::string& stderr_text = "")
      : HushError("ExternalToolError: " + tool + ": " + detail +
                  (exit_code >= 0 ? " (exit " + std::to_string(exit_code) + ")"
                                  : std::string()) +
                  (stderr_text.empty() ? std::string() : ": " + stderr_text)),
        tool_(tool),
        exit_code_(exit_code),
        stderr_text_(stderr_text) {}

  const std::string& Tool() const { return tool_; }
  int ExitCode() const { return exit_code_; }
  const std::string& StderrText() const { return stderr_text_; }

 private:
  std::string tool_;
  int exit_code_;
  std::string stderr_text_;
};

}  // namespace hush

#endif  // HUSH_UTIL_ERRORS_HPP_
