// Repository: Hush
// Component: Backend Selection and Model Names
// Purpose: Backend selector parsing and per-backend model-name translation.
// Copyright (c) 2026 RetroVue

#include <array>

#include "hush/transcript/ITranscriptionBackend.hpp"
#include "hush/util/Errors.hpp"
#include "hush/util/Strings.hpp"

namespace hush::transcript {

using hush::util::ToLower;
using hush::util::Trim;

namespace {

constexpr const char* kRemoteDefaultModel = "whisper-1";
constexpr const char* kLocalDefaultModel = "base";

constexpr std::array<const char*, 8> kLocalSizeNames = {
    "tiny", "base", "small", "medium", "large", "large-v1", "large-v2", "large-v3"};

}  // namespace

const char* BackendKindName(BackendKind kind) {
  switch (kind) {
    case BackendKind::kLocalWhisper:
      return "local_whisper";
    case BackendKind::kOpenAiApi:
      return "openai_api";
  }
  return "unknown";
}

BackendKind ParseBackendKind(const std::string& value) {
  const std::string v = ToLower(Trim(value));
  if (v == "local_whisper") return BackendKind::kLocalWhisper;
  if (v == "openai_api") return BackendKind::kOpenAiApi;
  throw ConfigError("invalid WHISPER_BACKEND value '" + value +
                    "'. Expected one of: local_whisper, openai_api");
}

std::string NormalizeModelForBackend(const std::string& model, BackendKind kind) {
  const std::string m = Trim(model);
  if (m.empty()) return m;

  if (kind == BackendKind::kLocalWhisper) {
    return m == kRemoteDefaultModel ? kLocalDefaultModel : m;
  }

  const std::string lowered = ToLower(m);
  for (const char* size_name : kLocalSizeNames) {
    if (lowered == size_name) return kRemoteDefaultModel;
  }
  return m;
}

}  // namespace hush::transcript
