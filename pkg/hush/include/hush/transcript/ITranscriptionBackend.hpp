// Repository: Hush
// Component: Transcription Backend Interface
// Purpose: Capability implemented by the local-model and remote-API engines.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_TRANSCRIPT_ITRANSCRIPTION_BACKEND_HPP_
#define HUSH_TRANSCRIPT_ITRANSCRIPTION_BACKEND_HPP_

#include <string>

#include "hush/audio/AudioTypes.hpp"
#include "hush/transcript/TranscriptTypes.hpp"

namespace hush::transcript {

enum class BackendKind { kLocalWhisper, kOpenAiApi };

const char* BackendKindName(BackendKind kind);

// Parses "local_whisper" / "openai_api" (case-insensitive, trimmed).
// Throws ConfigError for anything else.
BackendKind ParseBackendKind(const std::string& value);

// ITranscriptionBackend turns one chunk into the normalized response shape.
//
// Thread Safety:
// - Transcribe() may be called from several worker threads at once.
//   Implementations that cannot run concurrently serialize internally.
//
// Error Handling:
// - Any failure is thrown as a std::exception; the orchestrator retries.
class ITranscriptionBackend {
 public:
  virtual ~ITranscriptionBackend() = default;

  virtual BackendKind Kind() const = 0;

  virtual RawTranscript Transcribe(const audio::AudioChunk& chunk,
                                   const std::string& language,
                                   const std::string& model) = 0;
};

// Translates a user-facing model name into one the backend accepts, so a
// single configured name works with either engine.
std::string NormalizeModelForBackend(const std::string& model, BackendKind kind);

}  // namespace hush::transcript

#endif  // HUSH_TRANSCRIPT_ITRANSCRIPTION_BACKEND_HPP_
