// Repository: Hush
// Component: Pipeline Implementation
// Copyright (c) 2026 RetroVue

#include "hush/app/Pipeline.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include "hush/audio/Segmenter.hpp"
#include "hush/audio/WavFile.hpp"
#include "hush/censor/Artifacts.hpp"
#include "hush/censor/CensorCompiler.hpp"
#include "hush/detect/ProfanityDetector.hpp"
#include "hush/detect/SpanMerger.hpp"
#include "hush/detect/TermList.hpp"
#include "hush/media/FFmpegMediaProbe.hpp"
#include "hush/transcript/BackendFactory.hpp"
#include "hush/transcript/TranscriptJson.hpp"
#include "hush/transcript/TranscriptionOrchestrator.hpp"
#include "hush/util/Errors.hpp"
#include "hush/util/Logger.hpp"

namespace hush::app {

namespace fs = std::filesystem;
using hush::util::Logger;

const char* PipelineOutcomeName(PipelineOutcome outcome) {
  switch (outcome) {
    case PipelineOutcome::kProcessed:
      return "processed";
    case PipelineOutcome::kSkippedAlreadyClean:
      return "skipped_already_clean";
  }
  return "unknown";
}

Pipeline::Pipeline(AppConfig config, PipelineCollaborators collaborators)
    : config_(std::move(config)), collaborators_(std::move(collaborators)) {
  if (!collaborators_.probe) {
    collaborators_.probe = std::make_shared<media::FFmpegMediaProbe>();
  }
  if (!collaborators_.extractor) {
    collaborators_.extractor = std::make_shared<media::FFmpegAudioExtractor>();
  }
  if (!collaborators_.remuxer) {
    collaborators_.remuxer = std::make_shared<media::FFmpegRemuxer>();
  }
}

std::string Pipeline::TranscriptPath() const {
  return (fs::path(config_.output_dir) / "transcript.json").string();
}
std::string Pipeline::CensorLogPath() const {
  return (fs::path(config_.output_dir) / "censor_log.json").string();
}
std::string Pipeline::CleanTranscriptPath() const {
  return (fs::path(config_.output_dir) / "transcript_clean.txt").string();
}
std::string Pipeline::SubtitlesPath() const {
  return (fs::path(config_.output_dir) / "censored_subtitles.srt").string();
}
std::string Pipeline::DebugAudioDir() const {
  return (fs::path(config_.output_dir) / "audio_debug").string();
}

std::shared_ptr<transcript::ITranscriptionBackend> Pipeline::Backend() {
  if (!collaborators_.backend) {
    transcript::BackendOptions options;
    options.model_dir = config_.model_dir;
    options.remote.base_url = config_.openai_base_url;
    options.remote.api_key = config_.openai_api_key;
    collaborators_.backend = transcript::MakeTranscriptionBackend(config_.whisper_backend, options);
  }
  return collaborators_.backend;
}

void Pipeline::DumpDebugAudio(const audio::PcmAudio& pcm,
                              const std::vector<audio::AudioChunk>& chunks) {
  const fs::path dir(DebugAudioDir());
  try {
    fs::create_directories(dir);
    audio::WriteWavFile((dir / "audio.wav").string(), pcm.samples.data(), pcm.FrameCount(),
                        pcm.sample_rate, pcm.channels);
    for (const auto& chunk : chunks) {
      char name[32];
      std::snprintf(name, sizeof(name), "chunk_%03d.wav", chunk.index);
      audio::WriteWavFile((dir / name).string(), chunk.Samples(), chunk.SampleCount(),
                          chunk.SampleRate(), 1);
    }
    Logger::Info("[Pipeline] debug audio dumped to " + dir.string());
  } catch (const std::exception& e) {
    Logger::Warn(std::string("[Pipeline] failed to dump debug audio: ") + e.what());
  }
}

PipelineOutcome Pipeline::Run() {
  const auto t0 = std::chrono::steady_clock::now();
  summary_ = PipelineSummary{};

  std::error_code ec;
  fs::create_directories(config_.output_dir, ec);
  if (ec) {
    throw std::runtime_error("cannot create output directory " + config_.output_dir + ": " +
                             ec.message());
  }

  const censor::MediaProbeResult probe = collaborators_.probe->Probe(config_.input_path);
  if (!config_.force && censor::HasCleanMarker(probe)) {
    Logger::Info("[Pipeline] input already contains a '" + std::string(censor::kCleanMarkerTitle) +
                 "' audio track; skipping. Use --force (or FORCE=true) to override.");
    return PipelineOutcome::kSkippedAlreadyClean;
  }

  Logger::Info("[Pipeline] output media: " + config_.output_path);
  Logger::Info("[Pipeline] artifacts: " + config_.output_dir);

  auto pcm =
      std::make_shared<audio::PcmAudio>(collaborators_.extractor->Extract(config_.input_path));
  const std::vector<audio::AudioChunk> chunks =
      audio::SegmentAudio(pcm, config_.chunk_length_seconds);
  summary_.chunks = chunks.size();
  if (config_.debug_dump_audio) {
    DumpDebugAudio(*pcm, chunks);
  }

  transcript::OrchestratorConfig orch_config;
  orch_config.language = config_.audio_language;
  orch_config.primary_model = config_.whisper_model;
  orch_config.fallback_model = config_.whisper_fallback_model;
  orch_config.max_retries = config_.max_retries;
  orch_config.retry_delay = std::chrono::milliseconds(config_.retry_delay_ms);
  orch_config.max_workers = config_.max_workers;
  transcript::TranscriptionOrchestrator orchestrator(Backend(), orch_config,
                                                     collaborators_.wait_strategy);
  const transcript::TranscriptionResult transcript = orchestrator.Run(chunks);
  summary_.segments = transcript.segments.size();
  summary_.language = transcript.language;
  Logger::Info("[Pipeline] detected language: " + transcript.language);

  detect::DetectorConfig detector_config;
  detector_config.min_confidence = config_.min_confidence;
  detector_config.mode = config_.mode;
  const detect::ProfanityDetector detector(detect::BuildTerms(config_.profanity_words),
                                           detector_config);
  const std::vector<detect::ProfanityHit> hits = detector.Detect(transcript);
  const std::vector<detect::ProfanitySpan> spans =
      detect::MergeHits(hits, config_.max_gap_combine_ms);
  summary_.hits = hits.size();
  summary_.spans = spans.size();

  transcript::SaveTranscriptJson(transcript, TranscriptPath());
  censor::WriteTextFile(CensorLogPath(),
                        transcript::DumpArtifactJson(censor::BuildCensorLog(spans)));
  if (config_.emit_clean_transcript) {
    censor::WriteTextFile(CleanTranscriptPath(), censor::BuildCleanTranscript(transcript, spans));
  }
  if (config_.emit_subtitles) {
    censor::WriteTextFile(SubtitlesPath(), censor::BuildSubtitles(spans));
  }

  const censor::CensorCompiler compiler(config_.mode);
  const censor::CensorPlan plan = compiler.Compile(spans, probe, config_.output_path);
  collaborators_.remuxer->Remux(config_.input_path, plan, config_.output_path);

  const double elapsed =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  std::ostringstream oss;
  oss << "[Pipeline] finished in " << elapsed << "s chunks=" << summary_.chunks
      << " segments=" << summary_.segments << " hits=" << summary_.hits
      << " spans=" << summary_.spans << " output=" << config_.output_path;
  Logger::Info(oss.str());
  return PipelineOutcome::kProcessed;
}

}  // namespace hush::app
