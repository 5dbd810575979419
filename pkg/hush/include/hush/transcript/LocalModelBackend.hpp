// Repository: Hush
// Component: LocalModelBackend
// Purpose: In-process inference backend; at most one in-flight call per
//          model name.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_TRANSCRIPT_LOCAL_MODEL_BACKEND_HPP_
#define HUSH_TRANSCRIPT_LOCAL_MODEL_BACKEND_HPP_

#include <memory>
#include <string>
#include <vector>

#include "hush/transcript/ITranscriptionBackend.hpp"
#include "hush/transcript/ModelRegistry.hpp"

namespace hush::transcript {

class LocalModelBackend : public ITranscriptionBackend {
 public:
  // Throws std::invalid_argument for a null registry.
  explicit LocalModelBackend(std::shared_ptr<ModelRegistry> registry);

  BackendKind Kind() const override { return BackendKind::kLocalWhisper; }

  RawTranscript Transcribe(const audio::AudioChunk& chunk,
                           const std::string& language,
                           const std::string& model) override;

 private:
  std::shared_ptr<ModelRegistry> registry_;
};

// Candidate files for a model name, in lookup order. A name that already
// ends in .bin or .gguf is taken as a path as-is.
std::vector<std::string> CandidateModelPaths(const std::string& model_name,
                                             const std::string& model_dir);

// First existing candidate. Throws ConfigError when none exists.
std::string ResolveLocalModelPath(const std::string& model_name,
                                  const std::string& model_dir);

}  // namespace hush::transcript

#endif  // HUSH_TRANSCRIPT_LOCAL_MODEL_BACKEND_HPP_
