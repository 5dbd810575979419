// Repository: Hush
// Component: WhisperCppModel Implementation
// Purpose: Local inference through whisper.cpp with token-level timestamps.
// Copyright (c) 2026 RetroVue

#include "hush/transcript/WhisperCppModel.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "hush/transcript/LocalModelBackend.hpp"
#include "hush/util/Logger.hpp"
#include "hush/util/Strings.hpp"

#include "whisper.h"

namespace hush::transcript {

using hush::util::Logger;
using hush::util::Trim;

namespace {

// Keep errors/warnings always; info/debug only when verbose.
void WhisperLogCallback(ggml_log_level level, const char* text, void*) {
  if (text == nullptr) return;
  std::string line(text);
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
  if (line.empty()) return;
  switch (level) {
    case GGML_LOG_LEVEL_ERROR:
      Logger::Error("[whisper] " + line);
      break;
    case GGML_LOG_LEVEL_WARN:
      Logger::Warn("[whisper] " + line);
      break;
    default:
      Logger::Debug("[whisper] " + line);
      break;
  }
}

// whisper.cpp timestamps are in units of 10 ms.
double TicksToSeconds(int64_t ticks) { return static_cast<double>(ticks) / 100.0; }

struct WordAccumulator {
  std::string text;
  int64_t t0 = -1;
  int64_t t1 = -1;
  double p_sum = 0.0;
  int tokens = 0;

  bool Empty() const { return Trim(text).empty(); }

  RawWord Finish() const {
    RawWord w;
    w.word = Trim(text);
    w.start = TicksToSeconds(std::max<int64_t>(t0, 0));
    w.end = TicksToSeconds(std::max<int64_t>(t1, t0));
    if (tokens > 0) w.confidence = p_sum / tokens;
    return w;
  }
};

}  // namespace

std::shared_ptr<ILocalModel> WhisperCppModel::Load(const std::string& model_name,
                                                   const std::string& model_dir,
                                                   int n_threads) {
  const std::string path = ResolveLocalModelPath(model_name, model_dir);

  whisper_log_set(WhisperLogCallback, nullptr);

  whisper_context_params cparams = whisper_context_default_params();
  {
    std::ostringstream oss;
    oss << "[WhisperCppModel] init from: " << path;
    Logger::Info(oss.str());
  }
  whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
  if (ctx == nullptr) {
    throw std::runtime_error("WhisperCppModel: init failed for " + path);
  }
  if (n_threads <= 0) {
    n_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
  }
  return std::shared_ptr<ILocalModel>(new WhisperCppModel(ctx, path, n_threads));
}

WhisperCppModel::WhisperCppModel(whisper_context* ctx, std::string path, int n_threads)
    : ctx_(ctx), path_(std::move(path)), n_threads_(n_threads) {}

WhisperCppModel::~WhisperCppModel() {
  if (ctx_) {
    whisper_free(ctx_);
    ctx_ = nullptr;
  }
}

RawTranscript WhisperCppModel::Transcribe(const audio::AudioChunk& chunk,
                                          const std::string& language) {
  if (chunk.Samples() == nullptr || chunk.SampleCount() == 0) {
    throw std::invalid_argument("WhisperCppModel: empty chunk");
  }
  if (chunk.SampleRate() != WHISPER_SAMPLE_RATE) {
    throw std::invalid_argument("WhisperCppModel: expected " +
                                std::to_string(WHISPER_SAMPLE_RATE) + " Hz audio, got " +
                                std::to_string(chunk.SampleRate()));
  }

  // Convert int16 PCM to float [-1,1]
  std::vector<float> pcm_f32;
  pcm_f32.reserve(chunk.SampleCount());
  constexpr float kScale = 1.0f / 32768.0f;
  const int16_t* samples = chunk.Samples();
  for (size_t i = 0; i < chunk.SampleCount(); ++i) {
    pcm_f32.push_back(static_cast<float>(samples[i]) * kScale);
  }

  whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
  wparams.print_realtime = false;
  wparams.print_progress = false;
  wparams.print_timestamps = false;
  wparams.print_special = false;
  wparams.translate = false;
  wparams.language = language.empty() ? "auto" : language.c_str();
  wparams.detect_language = false;
  wparams.n_threads = n_threads_;
  wparams.token_timestamps = true;
  wparams.temperature = 0.0f;

  const int ret = whisper_full(ctx_, wparams, pcm_f32.data(), static_cast<int>(pcm_f32.size()));
  if (ret != 0) {
    throw std::runtime_error("WhisperCppModel: whisper_full failed ret=" + std::to_string(ret) +
                             " model=" + path_);
  }

  RawTranscript out;
  const int lang_id = whisper_full_lang_id(ctx_);
  const char* lang = lang_id >= 0 ? whisper_lang_str(lang_id) : nullptr;
  out.language = lang != nullptr ? lang : kUnknownLanguage;

  const whisper_token eot = whisper_token_eot(ctx_);
  std::ostringstream payload;
  payload << "whisper.cpp model=" << path_ << " language=" << out.language;

  const int n_segments = whisper_full_n_segments(ctx_);
  for (int i = 0; i < n_segments; ++i) {
    RawSegment seg;
    seg.id = i;
    seg.start = TicksToSeconds(whisper_full_get_segment_t0(ctx_, i));
    seg.end = TicksToSeconds(whisper_full_get_segment_t1(ctx_, i));
    const char* text = whisper_full_get_segment_text(ctx_, i);
    seg.text = text != nullptr ? Trim(text) : "";

    WordAccumulator acc;
    const int n_tokens = whisper_full_n_tokens(ctx_, i);
    for (int j = 0; j < n_tokens; ++j) {
      const whisper_token_data token = whisper_full_get_token_data(ctx_, i, j);
      if (token.id >= eot) continue;  // special / timestamp tokens
      const char* token_text = whisper_full_get_token_text(ctx_, i, j);
      if (token_text == nullptr || *token_text == '\0') continue;

      const std::string piece(token_text);
      if (piece.front() == ' ' && !acc.Empty()) {
        seg.words.push_back(acc.Finish());
        acc = WordAccumulator{};
      }
      if (acc.t0 < 0) acc.t0 = token.t0;
      acc.t1 = token.t1;
      acc.text += piece;
      acc.p_sum += token.p;
      ++acc.tokens;
    }
    if (!acc.Empty()) {
      seg.words.push_back(acc.Finish());
    }
    payload << "\n[" << seg.start << " -> " << *seg.end << "] " << seg.text;
    out.segments.push_back(std::move(seg));
  }
  out.payload = payload.str();
  return out;
}

}  // namespace hush::transcript
