// Repository: Hush
// Component: RemoteApiBackend
// Purpose: OpenAI-compatible /audio/transcriptions client (verbose_json with
//          segment and word timestamps).
// Copyright (c) 2026 RetroVue

#ifndef HUSH_TRANSCRIPT_REMOTE_API_BACKEND_HPP_
#define HUSH_TRANSCRIPT_REMOTE_API_BACKEND_HPP_

#include <string>

#include "hush/transcript/ITranscriptionBackend.hpp"

namespace hush::transcript {

struct RemoteApiConfig {
  std::string base_url = "https://api.openai.com/v1";
  std::string api_key;
  long timeout_seconds = 300;
};

// RemoteApiBackend uploads each chunk as an in-memory WAV file.
//
// Thread Safety:
// - Fully concurrent. Every call uses its own curl easy handle.
// - curl_global_init() must have run before the first call (main does it).
//
// Error Handling:
// - Transport failure, HTTP status >= 400 or an unparseable body throws
//   std::runtime_error; the orchestrator retries.
class RemoteApiBackend : public ITranscriptionBackend {
 public:
  // Throws ConfigError when the API key is empty.
  explicit RemoteApiBackend(RemoteApiConfig config);

  BackendKind Kind() const override { return BackendKind::kOpenAiApi; }

  RawTranscript Transcribe(const audio::AudioChunk& chunk,
                           const std::string& language,
                           const std::string& model) override;

  std::string EndpointUrl() const;

 private:
  RemoteApiConfig config_;
};

// Parses a verbose_json body. A top-level "words" array is distributed to
// the segment whose [start, end] holds the word's start, else the nearest
// segment by start time. Throws std::runtime_error on malformed JSON.
RawTranscript ParseVerboseJson(const std::string& body);

}  // namespace hush::transcript

#endif  // HUSH_TRANSCRIPT_REMOTE_API_BACKEND_HPP_
