// Repository: Hush
// Component: TranscriptionOrchestrator Implementation
// Purpose: Retry state machine and worker pool.
// Copyright (c) 2026 RetroVue

#include "hush/transcript/TranscriptionOrchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <tuple>

#include "hush/transcript/ResponseNormalizer.hpp"
#include "hush/util/Errors.hpp"
#include "hush/util/Logger.hpp"

namespace hush::transcript {

using hush::util::Logger;

const char* ChunkAttemptStateName(ChunkAttemptState state) {
  switch (state) {
    case ChunkAttemptState::kTryingPrimary:
      return "trying_primary";
    case ChunkAttemptState::kTryingFallback:
      return "trying_fallback";
    case ChunkAttemptState::kExhausted:
      return "exhausted";
  }
  return "unknown";
}

TranscriptionOrchestrator::TranscriptionOrchestrator(
    std::shared_ptr<ITranscriptionBackend> backend, OrchestratorConfig config,
    std::shared_ptr<util::IWaitStrategy> wait_strategy)
    : backend_(std::move(backend)),
      config_(std::move(config)),
      wait_strategy_(std::move(wait_strategy)) {
  if (!backend_) {
    throw std::invalid_argument("TranscriptionOrchestrator: backend is null");
  }
  if (config_.max_retries < 1) {
    throw ConfigError("max retries must be >= 1, got " + std::to_string(config_.max_retries));
  }
  if (!wait_strategy_) {
    wait_strategy_ = std::make_shared<util::RealtimeWaitStrategy>();
  }
  const BackendKind kind = backend_->Kind();
  primary_model_ = NormalizeModelForBackend(config_.primary_model, kind);
  fallback_model_ = NormalizeModelForBackend(
      config_.fallback_model.value_or(config_.primary_model), kind);
}

int TranscriptionOrchestrator::DefaultWorkerCount() {
  const unsigned int hc = std::thread::hardware_concurrency();
  if (hc == 0) return 4;
  return static_cast<int>(std::min(8u, hc));
}

int TranscriptionOrchestrator::WorkerCountFor(size_t chunk_count) const {
  const int configured = config_.max_workers > 0 ? config_.max_workers : DefaultWorkerCount();
  return static_cast<int>(std::max<size_t>(
      1, std::min(static_cast<size_t>(configured), chunk_count)));
}

ChunkTranscript TranscriptionOrchestrator::TranscribeChunk(const audio::AudioChunk& chunk) {
  ChunkAttemptState state = ChunkAttemptState::kTryingPrimary;
  std::string last_error = "no attempt completed";

  while (state != ChunkAttemptState::kExhausted) {
    const bool on_fallback = state == ChunkAttemptState::kTryingFallback;
    const std::string& model = on_fallback ? fallback_model_ : primary_model_;
    bool unknown_language = false;

    for (int attempt = 1; attempt <= config_.max_retries; ++attempt) {
      {
        std::ostringstream oss;
        oss << "[Orchestrator] chunk " << chunk.index << " model=" << model << " attempt "
            << attempt << "/" << config_.max_retries << " (" << ChunkAttemptStateName(state)
            << ")";
        Logger::Info(oss.str());
      }
      try {
        RawTranscript raw = backend_->Transcribe(chunk, config_.language, model);
        const std::string language = raw.language.empty() ? kUnknownLanguage : raw.language;

        if (language == kUnknownLanguage && !on_fallback) {
          std::ostringstream oss;
          oss << "[Orchestrator] chunk " << chunk.index << " returned unknown language with model "
              << model << "; moving to fallback model " << fallback_model_;
          Logger::Warn(oss.str());
          unknown_language = true;
          break;
        }

        ChunkTranscript result;
        result.chunk_index = chunk.index;
        result.language = language;
        result.model = model;
        result.segments = NormalizeResponse(raw, chunk.index, chunk.start_time);
        result.raw_payload = std::move(raw.payload);
        return result;
      } catch (const std::exception& e) {
        last_error = e.what();
        std::ostringstream oss;
        oss << "[Orchestrator] chunk " << chunk.index << " model=" << model << " attempt "
            << attempt << "/" << config_.max_retries << " failed: " << e.what();
        Logger::Warn(oss.str());
        if (attempt < config_.max_retries) {
          wait_strategy_->WaitFor(config_.retry_delay);
        }
      }
    }

    if (unknown_language) {
      last_error = "unknown language from model " + model;
    }
    state = on_fallback ? ChunkAttemptState::kExhausted : ChunkAttemptState::kTryingFallback;
  }

  throw TranscriptionExhaustedError(chunk.index, last_error);
}

TranscriptionResult TranscriptionOrchestrator::Run(const std::vector<audio::AudioChunk>& chunks) {
  TranscriptionResult result;
  if (chunks.empty()) {
    Logger::Warn("[Orchestrator] no chunks to transcribe");
    return result;
  }

  const int workers = WorkerCountFor(chunks.size());
  {
    std::ostringstream oss;
    oss << "[Orchestrator] transcribing " << chunks.size() << " chunks with " << workers
        << " workers backend=" << BackendKindName(backend_->Kind())
        << " primary=" << primary_model_ << " fallback=" << fallback_model_;
    Logger::Info(oss.str());
  }

  // One slot per chunk position; each worker writes only the slots it claims.
  std::vector<std::optional<ChunkTranscript>> slots(chunks.size());
  std::atomic<size_t> next{0};
  std::atomic<int> failed{0};

  auto worker_loop = [&]() {
    for (size_t i = next.fetch_add(1); i < chunks.size(); i = next.fetch_add(1)) {
      try {
        slots[i] = TranscribeChunk(chunks[i]);
      } catch (const TranscriptionExhaustedError& e) {
        failed.fetch_add(1);
        std::ostringstream oss;
        oss << "[Orchestrator] failed to transcribe chunk " << e.ChunkIndex() << ": "
            << e.LastError();
        Logger::Error(oss.str());
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(static_cast<size_t>(workers));
  for (int w = 0; w < workers; ++w) {
    threads.emplace_back(worker_loop);
  }
  for (auto& t : threads) {
    t.join();
  }

  for (auto& slot : slots) {
    if (!slot) continue;
    if (result.language == kUnknownLanguage && slot->language != kUnknownLanguage) {
      result.language = slot->language;
    }
    result.raw_payloads.push_back(std::move(slot->raw_payload));
    for (auto& seg : slot->segments) {
      result.segments.push_back(std::move(seg));
    }
  }

  std::stable_sort(result.segments.begin(), result.segments.end(),
                   [](const TranscriptSegment& a, const TranscriptSegment& b) {
                     return std::tie(a.start, a.chunk_index, a.id) <
                            std::tie(b.start, b.chunk_index, b.id);
                   });

  {
    std::ostringstream oss;
    oss << "[Orchestrator] transcription complete: segments=" << result.segments.size()
        << " chunks_ok=" << (chunks.size() - static_cast<size_t>(failed.load()))
        << " chunks_failed=" << failed.load() << " language=" << result.language;
    Logger::Info(oss.str());
  }
  return result;
}

}  // namespace hush::transcript
