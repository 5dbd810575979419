// Repository: Hush
// Component: LocalModelBackend Implementation
// Copyright (c) 2026 RetroVue

#include "hush/transcript/LocalModelBackend.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "hush/util/Errors.hpp"
#include "hush/util/Logger.hpp"
#include "hush/util/Strings.hpp"

namespace hush::transcript {

using hush::util::EndsWith;
using hush::util::Logger;

LocalModelBackend::LocalModelBackend(std::shared_ptr<ModelRegistry> registry)
    : registry_(std::move(registry)) {
  if (!registry_) {
    throw std::invalid_argument("LocalModelBackend: registry is null");
  }
}

RawTranscript LocalModelBackend::Transcribe(const audio::AudioChunk& chunk,
                                            const std::string& language,
                                            const std::string& model) {
  std::shared_ptr<ILocalModel> loaded = registry_->Acquire(model);
  std::mutex& inference_mutex = registry_->TranscribeMutex(model);

  const auto t0 = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(inference_mutex);

  const double waited_s =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  if (waited_s > 0.01) {
    std::ostringstream oss;
    oss << "[LocalModelBackend] waited " << waited_s << "s for inference lock model="
        << model << " chunk=" << chunk.index << " thread=" << std::this_thread::get_id();
    Logger::Debug(oss.str());
  }

  return loaded->Transcribe(chunk, language);
}

std::vector<std::string> CandidateModelPaths(const std::string& model_name,
                                             const std::string& model_dir) {
  if (EndsWith(model_name, ".bin") || EndsWith(model_name, ".gguf")) {
    return {model_name};
  }
  const std::string dir = model_dir.empty() ? "." : model_dir;
  return {
      dir + "/ggml-" + model_name + ".bin",
      dir + "/" + model_name + ".bin",
      dir + "/ggml-" + model_name + ".gguf",
      dir + "/" + model_name + ".gguf",
  };
}

std::string ResolveLocalModelPath(const std::string& model_name,
                                  const std::string& model_dir) {
  const std::vector<std::string> candidates = CandidateModelPaths(model_name, model_dir);
  for (const auto& path : candidates) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
      return path;
    }
  }
  std::ostringstream oss;
  oss << "no model file for '" << model_name << "' (tried";
  for (const auto& path : candidates) oss << " " << path;
  oss << ")";
  throw ConfigError(oss.str());
}

}  // namespace hush::transcript
