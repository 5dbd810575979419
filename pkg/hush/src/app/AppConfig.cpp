// Repository: Hush
// Component: AppConfig Implementation
// Purpose: Flag parsing, environment/.env merging and validation.
// Copyright (c) 2026 RetroVue

#include "hush/app/AppConfig.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "hush/detect/TermList.hpp"
#include "hush/util/Errors.hpp"
#include "hush/util/Logger.hpp"
#include "hush/util/Strings.hpp"

namespace hush::app {

using hush::util::Logger;
using hush::util::ToLower;
using hush::util::Trim;

namespace {

// A set-but-blank variable counts as unset.
std::optional<std::string> EnvValue(const EnvLookup& env, const char* name) {
  std::optional<std::string> raw = env(name);
  if (!raw) return std::nullopt;
  std::string value = Trim(*raw);
  if (value.empty()) return std::nullopt;
  return value;
}

int ParseInt(const std::string& name, const std::string& text) {
  const std::string t = Trim(text);
  try {
    size_t pos = 0;
    const int v = std::stoi(t, &pos);
    if (pos == t.size()) return v;
  } catch (const std::exception&) {
    // Reported below with the variable name.
  }
  throw ConfigError("invalid integer for " + name + "='" + text + "'");
}

double ParseDouble(const std::string& name, const std::string& text) {
  const std::string t = Trim(text);
  try {
    size_t pos = 0;
    const double v = std::stod(t, &pos);
    if (pos == t.size() && std::isfinite(v)) return v;
  } catch (const std::exception&) {
    // Reported below with the variable name.
  }
  throw ConfigError("invalid number for " + name + "='" + text + "'");
}

bool ParseBool(const std::string& name, const std::string& text) {
  const std::string v = ToLower(Trim(text));
  if (v == "true") return true;
  if (v == "false") return false;
  throw ConfigError("invalid boolean for " + name + "='" + text +
                    "'. Expected 'true' or 'false' (case-insensitive)");
}

// Resolved raw value plus the name it came from, for error messages.
struct Setting {
  std::string value;
  std::string source;
};

std::optional<Setting> Resolve(const std::optional<std::string>& cli, const char* flag,
                               const EnvLookup& env, const char* var) {
  if (cli) return Setting{*cli, flag};
  if (auto v = EnvValue(env, var)) return Setting{*v, var};
  return std::nullopt;
}

bool ResolveBool(const std::optional<bool>& cli, const EnvLookup& env, const char* var,
                 bool fallback) {
  if (cli) return *cli;
  if (auto v = EnvValue(env, var)) return ParseBool(var, *v);
  return fallback;
}

std::string StripQuotes(const std::string& value) {
  if (value.size() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

}  // namespace

// =============================================================================
// Command line
// =============================================================================

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --input PATH --output PATH [OPTIONS]\n"
            << "\n"
            << "Mute or bleep spoken profanity in a media file.\n"
            << "\n"
            << "REQUIRED:\n"
            << "  -i, --input PATH               Input media file\n"
            << "  -o, --output PATH              Output media file\n"
            << "\n"
            << "CENSORING:\n"
            << "  --mode mute|bleep              Censor method (default: mute)\n"
            << "  --profanity-list PATH          JSON array or one term per line\n"
            << "  --min-confidence F             Word confidence threshold (default: 0.6)\n"
            << "  --max-gap-combine-ms N         Merge hits closer than N ms (default: 500)\n"
            << "  --force                        Process even if a Clean track exists\n"
            << "\n"
            << "TRANSCRIPTION:\n"
            << "  --audio-language CODE          Spoken language (default: en)\n"
            << "  --chunk-length-seconds N       Chunk length (default: 300)\n"
            << "  --whisper-backend NAME         local_whisper | openai_api\n"
            << "  --whisper-model NAME           Model name (default: base)\n"
            << "  --whisper-fallback-model NAME  Model used after the primary gives up\n"
            << "  --max-workers N                Parallel chunk workers (default: auto)\n"
            << "\n"
            << "OUTPUT:\n"
            << "  --output-dir DIR               Artifacts directory (default: out)\n"
            << "  --emit-clean-transcript        Write transcript_clean.txt\n"
            << "  --emit-subtitles               Write censored_subtitles.srt\n"
            << "  --debug-dump-audio             Write extracted audio and chunks\n"
            << "  -v, --verbose                  Debug logging\n"
            << "  -h, --help                     Show this help message\n"
            << "\n"
            << "Every option can also be set through the environment or a .env file\n"
            << "(MODE, AUDIO_LANGUAGE, WHISPER_BACKEND, OPENAI_API_KEY, ...).\n";
}

CliOverrides ParseCommandLine(int argc, const char* const argv[]) {
  CliOverrides cli;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw ConfigError("missing value for " + arg);
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      cli.help = true;
      return cli;
    } else if (arg == "--input" || arg == "-i") {
      cli.input = value();
    } else if (arg == "--output" || arg == "-o") {
      cli.output = value();
    } else if (arg == "--mode") {
      cli.mode = value();
    } else if (arg == "--profanity-list") {
      cli.profanity_list = value();
    } else if (arg == "--audio-language") {
      cli.audio_language = value();
    } else if (arg == "--chunk-length-seconds") {
      cli.chunk_length_seconds = value();
    } else if (arg == "--min-confidence") {
      cli.min_confidence = value();
    } else if (arg == "--max-gap-combine-ms") {
      cli.max_gap_combine_ms = value();
    } else if (arg == "--output-dir") {
      cli.output_dir = value();
    } else if (arg == "--whisper-backend") {
      cli.whisper_backend = value();
    } else if (arg == "--whisper-model") {
      cli.whisper_model = value();
    } else if (arg == "--whisper-fallback-model") {
      cli.whisper_fallback_model = value();
    } else if (arg == "--max-workers") {
      cli.max_workers = value();
    } else if (arg == "--emit-clean-transcript") {
      cli.emit_clean_transcript = true;
    } else if (arg == "--emit-subtitles") {
      cli.emit_subtitles = true;
    } else if (arg == "--verbose" || arg == "-v") {
      cli.verbose = true;
    } else if (arg == "--debug-dump-audio") {
      cli.debug_dump_audio = true;
    } else if (arg == "--force") {
      cli.force = true;
    } else {
      throw ConfigError("unknown argument: " + arg);
    }
  }
  return cli;
}

// =============================================================================
// Environment
// =============================================================================

EnvLookup ProcessEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* v = std::getenv(name.c_str());
    if (v == nullptr) return std::nullopt;
    return std::string(v);
  };
}

std::map<std::string, std::string> ParseDotEnv(const std::string& content) {
  std::map<std::string, std::string> entries;
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    line = Trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = Trim(line.substr(7));

    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    const std::string key = Trim(line.substr(0, eq));
    if (key.empty()) continue;
    entries[key] = StripQuotes(Trim(line.substr(eq + 1)));
  }
  return entries;
}

void LoadDotEnvFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) return;
  std::ostringstream content;
  content << in.rdbuf();

  int loaded = 0;
  for (const auto& [key, value] : ParseDotEnv(content.str())) {
    if (std::getenv(key.c_str()) != nullptr) continue;
    if (setenv(key.c_str(), value.c_str(), 0) != 0) {
      throw ConfigError("cannot set environment variable " + key + " from " + path);
    }
    ++loaded;
  }
  std::ostringstream oss;
  oss << "[Config] loaded " << loaded << " setting(s) from " << path;
  Logger::Debug(oss.str());
}

// =============================================================================
// Resolution
// =============================================================================

AppConfig LoadAppConfig(const CliOverrides& cli, const EnvLookup& env,
                        const LoadOptions& options) {
  AppConfig config;

  if (!cli.input || Trim(*cli.input).empty()) {
    throw ConfigError("--input is required");
  }
  if (!cli.output || Trim(*cli.output).empty()) {
    throw ConfigError("--output is required");
  }
  config.input_path = *cli.input;
  config.output_path = *cli.output;
  if (options.require_input_exists) {
    std::error_code ec;
    if (!std::filesystem::exists(config.input_path, ec)) {
      throw ConfigError("input file does not exist: " + config.input_path);
    }
  }

  if (auto s = Resolve(cli.mode, "--mode", env, "MODE")) {
    config.mode = detect::ParseCensorMode(s->value);
  }
  if (auto s = Resolve(cli.audio_language, "--audio-language", env, "AUDIO_LANGUAGE")) {
    config.audio_language = Trim(s->value);
  }
  if (auto s = Resolve(cli.chunk_length_seconds, "--chunk-length-seconds", env,
                       "CHUNK_LENGTH_SECONDS")) {
    config.chunk_length_seconds = ParseDouble(s->source, s->value);
  }
  if (auto s = Resolve(cli.min_confidence, "--min-confidence", env, "MIN_CONFIDENCE")) {
    config.min_confidence = ParseDouble(s->source, s->value);
  }
  if (auto s = Resolve(cli.max_gap_combine_ms, "--max-gap-combine-ms", env,
                       "MAX_GAP_COMBINE_MS")) {
    config.max_gap_combine_ms = ParseInt(s->source, s->value);
  }
  if (auto s = Resolve(cli.output_dir, "--output-dir", env, "OUTPUT_DIR")) {
    config.output_dir = s->value;
  }
  if (auto s = Resolve(cli.whisper_backend, "--whisper-backend", env, "WHISPER_BACKEND")) {
    config.whisper_backend = transcript::ParseBackendKind(s->value);
  }
  if (auto s = Resolve(cli.whisper_model, "--whisper-model", env, "WHISPER_MODEL")) {
    config.whisper_model = Trim(s->value);
  }
  if (auto s = Resolve(cli.whisper_fallback_model, "--whisper-fallback-model", env,
                       "WHISPER_FALLBACK_MODEL")) {
    config.whisper_fallback_model = Trim(s->value);
  }
  if (auto s = Resolve(cli.max_workers, "--max-workers", env, "MAX_WORKERS")) {
    config.max_workers = ParseInt(s->source, s->value);
  }
  if (auto v = EnvValue(env, "MAX_RETRIES")) {
    config.max_retries = ParseInt("MAX_RETRIES", *v);
  }
  if (auto v = EnvValue(env, "RETRY_DELAY_MS")) {
    config.retry_delay_ms = ParseInt("RETRY_DELAY_MS", *v);
  }
  if (auto v = EnvValue(env, "WHISPER_MODEL_DIR")) {
    config.model_dir = *v;
  }
  if (auto v = EnvValue(env, "OPENAI_API_KEY")) {
    config.openai_api_key = *v;
  }
  if (auto v = EnvValue(env, "OPENAI_BASE_URL")) {
    config.openai_base_url = *v;
  }

  config.emit_clean_transcript =
      ResolveBool(cli.emit_clean_transcript, env, "EMIT_CLEAN_TRANSCRIPT", false);
  config.emit_subtitles = ResolveBool(cli.emit_subtitles, env, "EMIT_SUBTITLES", false);
  config.verbose = ResolveBool(cli.verbose, env, "VERBOSE", false);
  config.debug_dump_audio = ResolveBool(cli.debug_dump_audio, env, "DEBUG_DUMP_AUDIO", false);
  config.force = ResolveBool(cli.force, env, "FORCE", false);

  if (!(config.chunk_length_seconds > 0.0)) {
    throw ConfigError("chunk length must be positive, got " +
                      std::to_string(config.chunk_length_seconds));
  }
  if (config.chunk_length_seconds > kMaxChunkLengthSeconds) {
    throw ConfigError("chunk length must be at most " + std::to_string(kMaxChunkLengthSeconds) +
                      " seconds, got " + std::to_string(config.chunk_length_seconds));
  }
  if (!(config.min_confidence >= 0.0 && config.min_confidence <= 1.0)) {
    throw ConfigError("min confidence must be within [0, 1], got " +
                      std::to_string(config.min_confidence));
  }
  if (config.max_gap_combine_ms < 0) {
    throw ConfigError("max gap must be non-negative, got " +
                      std::to_string(config.max_gap_combine_ms));
  }
  if (config.max_retries < 1) {
    throw ConfigError("MAX_RETRIES must be >= 1, got " + std::to_string(config.max_retries));
  }
  if (config.retry_delay_ms < 0) {
    throw ConfigError("RETRY_DELAY_MS must be non-negative");
  }
  if (config.max_workers < 0) {
    throw ConfigError("max workers must be non-negative");
  }

  if (auto s = Resolve(cli.profanity_list, "--profanity-list", env, "PROFANITY_LIST")) {
    config.profanity_list_path = s->value;
    config.profanity_words = detect::LoadTermListFile(config.profanity_list_path);
  } else {
    config.profanity_words = detect::DefaultProfanityWords();
  }

  return config;
}

}  // namespace hush::app
