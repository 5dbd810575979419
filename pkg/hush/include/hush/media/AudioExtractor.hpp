// Repository: Hush
// Component: Audio Extraction
// Purpose: Primary audio of any container -> mono 16-bit 16 kHz PCM.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_MEDIA_AUDIO_EXTRACTOR_HPP_
#define HUSH_MEDIA_AUDIO_EXTRACTOR_HPP_

#include <string>

#include "hush/audio/AudioTypes.hpp"

namespace hush::media {

// Throws ExternalToolError on failure.
class IAudioExtractor {
 public:
  virtual ~IAudioExtractor() = default;
  virtual audio::PcmAudio Extract(const std::string& path) = 0;
};

// Decodes the best audio stream with libavcodec and resamples it with
// libswresample.
class FFmpegAudioExtractor : public IAudioExtractor {
 public:
  explicit FFmpegAudioExtractor(int sample_rate = audio::kTranscriptionSampleRate);

  audio::PcmAudio Extract(const std::string& path) override;

 private:
  int sample_rate_;
};

}  // namespace hush::media

#endif  // HUSH_MEDIA_AUDIO_EXTRACTOR_HPP_
