// Repository: Hush
// Component: AppConfig
// Purpose: Command line > environment > .env > default configuration.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_APP_APP_CONFIG_HPP_
#define HUSH_APP_APP_CONFIG_HPP_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "hush/detect/ProfanityTypes.hpp"
#include "hush/transcript/ITranscriptionBackend.hpp"

namespace hush::app {

// Values given on the command line. Unset fields fall through to the
// environment. Numeric flags are kept as text so validation reports the
// flag exactly as typed.
struct CliOverrides {
  std::optional<std::string> input;
  std::optional<std::string> output;
  std::optional<std::string> mode;
  std::optional<std::string> profanity_list;
  std::optional<std::string> audio_language;
  std::optional<std::string> chunk_length_seconds;
  std::optional<std::string> min_confidence;
  std::optional<std::string> max_gap_combine_ms;
  std::optional<std::string> output_dir;
  std::optional<std::string> whisper_backend;
  std::optional<std::string> whisper_model;
  std::optional<std::string> whisper_fallback_model;
  std::optional<std::string> max_workers;
  std::optional<bool> emit_clean_transcript;
  std::optional<bool> emit_subtitles;
  std::optional<bool> verbose;
  std::optional<bool> debug_dump_audio;
  std::optional<bool> force;
  bool help = false;
};

// Throws ConfigError for an unknown flag or a flag missing its value.
CliOverrides ParseCommandLine(int argc, const char* const argv[]);

void PrintUsage(const char* program_name);

// Upper bound for --chunk-length-seconds / CHUNK_LENGTH_SECONDS.
constexpr double kMaxChunkLengthSeconds = 24.0 * 60.0 * 60.0;

struct AppConfig {
  std::string input_path;
  std::string output_path;
  detect::CensorMode mode = detect::CensorMode::kMute;
  std::string profanity_list_path;  // Empty = built-in list
  std::string audio_language = "en";
  double chunk_length_seconds = 300.0;
  double min_confidence = 0.6;
  int max_gap_combine_ms = 500;
  std::string output_dir = "out";
  bool emit_clean_transcript = false;
  bool emit_subtitles = false;
  bool verbose = false;
  bool debug_dump_audio = false;
  bool force = false;

  transcript::BackendKind whisper_backend = transcript::BackendKind::kLocalWhisper;
  std::string whisper_model = "base";
  std::optional<std::string> whisper_fallback_model;
  int max_retries = 3;
  int retry_delay_ms = 2000;
  int max_workers = 0;  // 0 = automatic
  std::string model_dir = "models";
  std::string openai_api_key;
  std::string openai_base_url = "https://api.openai.com/v1";

  std::vector<std::string> profanity_words;
};

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

EnvLookup ProcessEnvironment();

// KEY=VALUE lines; '#' comments, blank lines and an optional "export "
// prefix are skipped; matching single or double quotes are removed.
std::map<std::string, std::string> ParseDotEnv(const std::string& content);

// Copies .env entries into the process environment without replacing
// variables that are already set. A missing file is not an error.
void LoadDotEnvFile(const std::string& path);

struct LoadOptions {
  bool require_input_exists = true;
};

// Resolves every setting (CLI > env > default), validates it and loads the
// profanity list. Throws ConfigError naming the offending flag or variable.
AppConfig LoadAppConfig(const CliOverrides& cli, const EnvLookup& env,
                        const LoadOptions& options = LoadOptions{});

}  // namespace hush::app

#endif  // HUSH_APP_APP_CONFIG_HPP_
