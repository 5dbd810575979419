// Repository: Hush
// Component: Pipeline
// Purpose: End-to-end run: probe, extract, segment, transcribe, detect,
//          merge, write artifacts, remux.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_APP_PIPELINE_HPP_
#define HUSH_APP_PIPELINE_HPP_

#include <memory>
#include <string>
#include <vector>

#include "hush/app/AppConfig.hpp"
#include "hush/audio/AudioTypes.hpp"
#include "hush/censor/MediaProbe.hpp"
#include "hush/media/AudioExtractor.hpp"
#include "hush/media/MediaRemuxer.hpp"
#include "hush/transcript/ITranscriptionBackend.hpp"
#include "hush/util/IWaitStrategy.hpp"

namespace hush::app {

enum class PipelineOutcome { kProcessed, kSkippedAlreadyClean };

const char* PipelineOutcomeName(PipelineOutcome outcome);

// Collaborators left null are built from the config: FFmpegMediaProbe,
// FFmpegAudioExtractor, FFmpegRemuxer, and the backend factory.
struct PipelineCollaborators {
  std::shared_ptr<censor::IMediaProbe> probe;
  std::shared_ptr<media::IAudioExtractor> extractor;
  std::shared_ptr<media::IMediaRemuxer> remuxer;
  std::shared_ptr<transcript::ITranscriptionBackend> backend;
  std::shared_ptr<util::IWaitStrategy> wait_strategy;
};

struct PipelineSummary {
  size_t chunks = 0;
  size_t segments = 0;
  size_t hits = 0;
  size_t spans = 0;
  std::string language;
};

// Pipeline owns one run. Any error other than a per-chunk transcription
// failure propagates out of Run(); artifacts written before it are not
// guaranteed consistent.
class Pipeline {
 public:
  Pipeline(AppConfig config, PipelineCollaborators collaborators);

  PipelineOutcome Run();

  const PipelineSummary& Summary() const { return summary_; }

  std::string TranscriptPath() const;
  std::string CensorLogPath() const;
  std::string CleanTranscriptPath() const;
  std::string SubtitlesPath() const;
  std::string DebugAudioDir() const;

 private:
  void DumpDebugAudio(const audio::PcmAudio& pcm, const std::vector<audio::AudioChunk>& chunks);
  std::shared_ptr<transcript::ITranscriptionBackend> Backend();

  AppConfig config_;
  PipelineCollaborators collaborators_;
  PipelineSummary summary_;
};

}  // namespace hush::app

#endif  // HUSH_APP_PIPELINE_HPP_
