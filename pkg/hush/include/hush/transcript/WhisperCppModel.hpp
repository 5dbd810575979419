// Repository: Hush
// Component: WhisperCppModel
// Purpose: whisper.cpp inference wrapped as an ILocalModel.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_TRANSCRIPT_WHISPER_CPP_MODEL_HPP_
#define HUSH_TRANSCRIPT_WHISPER_CPP_MODEL_HPP_

#include <memory>
#include <string>

#include "hush/transcript/ModelRegistry.hpp"

struct whisper_context;

namespace hush::transcript {

// WhisperCppModel owns one whisper_context.
//
// Thread Safety:
// - Not thread-safe. The registry's per-model mutex serializes Transcribe().
//
// Output:
// - Tokens are grouped into words (a token beginning with a space opens a
//   new word; special tokens are skipped). Word confidence is the mean
//   token probability. Times are whisper's 10 ms ticks converted to seconds,
//   relative to the chunk.
class WhisperCppModel : public ILocalModel {
 public:
  // Resolves model_name under model_dir and loads it.
  // Throws ConfigError if no file matches, std::runtime_error if whisper
  // fails to initialize from it.
  static std::shared_ptr<ILocalModel> Load(const std::string& model_name,
                                           const std::string& model_dir,
                                           int n_threads);

  ~WhisperCppModel() override;

  WhisperCppModel(const WhisperCppModel&) = delete;
  WhisperCppModel& operator=(const WhisperCppModel&) = delete;

  RawTranscript Transcribe(const audio::AudioChunk& chunk,
                           const std::string& language) override;

 private:
  WhisperCppModel(whisper_context* ctx, std::string path, int n_threads);

  whisper_context* ctx_;
  std::string path_;
  int n_threads_;
};

}  // namespace hush::transcript

#endif  // HUSH_TRANSCRIPT_WHISPER_CPP_MODEL_HPP_
