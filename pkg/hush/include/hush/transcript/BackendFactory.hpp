// Repository: Hush
// Component: BackendFactory
// Purpose: Builds the configured transcription backend.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_TRANSCRIPT_BACKEND_FACTORY_HPP_
#define HUSH_TRANSCRIPT_BACKEND_FACTORY_HPP_

#include <memory>
#include <string>

#include "hush/transcript/ITranscriptionBackend.hpp"
#include "hush/transcript/RemoteApiBackend.hpp"

namespace hush::transcript {

struct BackendOptions {
  std::string model_dir = "models";
  int inference_threads = 0;  // 0 = hardware concurrency
  RemoteApiConfig remote;
};

// True when this build links whisper.cpp.
bool LocalInferenceAvailable();

// Throws ConfigError when the selected backend cannot be built (no
// whisper.cpp in this build, missing API key).
std::shared_ptr<ITranscriptionBackend> MakeTranscriptionBackend(BackendKind kind,
                                                                const BackendOptions& options);

}  // namespace hush::transcript

#endif  // HUSH_TRANSCRIPT_BACKEND_FACTORY_HPP_
