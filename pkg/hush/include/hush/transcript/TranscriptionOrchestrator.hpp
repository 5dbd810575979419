// Repository: Hush
// Component: TranscriptionOrchestrator
// Purpose: Concurrent per-chunk transcription with retry and model fallback,
//          aggregated into one time-ordered transcript.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_TRANSCRIPT_TRANSCRIPTION_ORCHESTRATOR_HPP_
#define HUSH_TRANSCRIPT_TRANSCRIPTION_ORCHESTRATOR_HPP_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hush/audio/AudioTypes.hpp"
#include "hush/transcript/ITranscriptionBackend.hpp"
#include "hush/transcript/TranscriptTypes.hpp"
#include "hush/util/IWaitStrategy.hpp"

namespace hush::transcript {

struct OrchestratorConfig {
  std::string language = "en";
  std::string primary_model = "base";
  std::optional<std::string> fallback_model;  // Defaults to primary_model
  int max_retries = 3;
  std::chrono::milliseconds retry_delay{2000};
  int max_workers = 0;  // 0 = DefaultWorkerCount()
};

// Per-chunk retry state.
enum class ChunkAttemptState { kTryingPrimary, kTryingFallback, kExhausted };

const char* ChunkAttemptStateName(ChunkAttemptState state);

// One successfully transcribed chunk.
struct ChunkTranscript {
  int chunk_index = 0;
  std::string language = kUnknownLanguage;
  std::string model;
  std::vector<TranscriptSegment> segments;  // Absolute times
  std::string raw_payload;
};

// TranscriptionOrchestrator maps chunks to transcript segments through one
// injected backend.
//
// Retry policy (per chunk):
// - kTryingPrimary: up to max_retries attempts on the primary model, waiting
//   retry_delay between attempts (not after the last). A response whose
//   language is "unknown" ends this state early.
// - kTryingFallback: the same budget on the fallback model. An "unknown"
//   response here is accepted as the chunk's result.
// - kExhausted: TranscriptionExhaustedError with the last backend error.
//
// Concurrency:
// - Run() uses min(max_workers, chunk count) std::threads pulling chunk
//   positions from a shared atomic cursor. Results land in a slot per chunk,
//   so completion order never matters; segments are sorted once at the end
//   by (start, chunk_index, id).
// - A chunk that exhausts its retries is logged and excluded. Siblings keep
//   running.
// - The backend decides its own concurrency limits (LocalModelBackend holds
//   a per-model lock; RemoteApiBackend runs freely).
class TranscriptionOrchestrator {
 public:
  // wait_strategy defaults to RealtimeWaitStrategy.
  // Throws std::invalid_argument for a null backend, ConfigError for
  // max_retries < 1.
  TranscriptionOrchestrator(std::shared_ptr<ITranscriptionBackend> backend,
                            OrchestratorConfig config,
                            std::shared_ptr<util::IWaitStrategy> wait_strategy = nullptr);

  // Throws TranscriptionExhaustedError when every attempt failed.
  ChunkTranscript TranscribeChunk(const audio::AudioChunk& chunk);

  TranscriptionResult Run(const std::vector<audio::AudioChunk>& chunks);

  // min(8, hardware concurrency), or 4 when it cannot be determined.
  static int DefaultWorkerCount();

  int WorkerCountFor(size_t chunk_count) const;

  const std::string& PrimaryModel() const { return primary_model_; }
  const std::string& FallbackModel() const { return fallback_model_; }

 private:
  std::shared_ptr<ITranscriptionBackend> backend_;
  OrchestratorConfig config_;
  std::shared_ptr<util::IWaitStrategy> wait_strategy_;
  std::string primary_model_;   // Normalized for the backend
  std::string fallback_model_;  // Normalized for the backend
};

}  // namespace hush::transcript

#endif  // HUSH_TRANSCRIPT_TRANSCRIPTION_ORCHESTRATOR_HPP_
