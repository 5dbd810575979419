// Repository: Hush
// Component: BackendFactory Implementation
// Copyright (c) 2026 RetroVue

#include "hush/transcript/BackendFactory.hpp"

#include "hush/transcript/LocalModelBackend.hpp"
#include "hush/transcript/ModelRegistry.hpp"
#include "hush/util/Errors.hpp"

#ifdef HUSH_HAVE_WHISPER_CPP
#include "hush/transcript/WhisperCppModel.hpp"
#endif

namespace hush::transcript {

bool LocalInferenceAvailable() {
#ifdef HUSH_HAVE_WHISPER_CPP
  return true;
#else
  return false;
#endif
}

std::shared_ptr<ITranscriptionBackend> MakeTranscriptionBackend(BackendKind kind,
                                                                const BackendOptions& options) {
  switch (kind) {
    case BackendKind::kOpenAiApi:
      return std::make_shared<RemoteApiBackend>(options.remote);
    case BackendKind::kLocalWhisper: {
#ifdef HUSH_HAVE_WHISPER_CPP
      const std::string model_dir = options.model_dir;
      const int threads = options.inference_threads;
      auto registry = std::make_shared<ModelRegistry>(
          [model_dir, threads](const std::string& model_name) {
            return WhisperCppModel::Load(model_name, model_dir, threads);
          });
      return std::make_shared<LocalModelBackend>(std::move(registry));
#else
      throw ConfigError(
          "local_whisper backend is not available: this build was configured without "
          "whisper.cpp. Use WHISPER_BACKEND=openai_api or rebuild with whisper.cpp installed");
#endif
    }
  }
  throw ConfigError("unsupported transcription backend");
}

}  // namespace hush::transcript
