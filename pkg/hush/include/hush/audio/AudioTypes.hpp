// Repository: Hush
// Component: Audio Types
// Purpose: In-memory PCM audio and the time-offset chunks cut from it.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_AUDIO_AUDIO_TYPES_HPP_
#define HUSH_AUDIO_AUDIO_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace hush::audio {

// Sample rate the extractor produces and the backends expect.
constexpr int kTranscriptionSampleRate = 16000;

// Interleaved signed 16-bit PCM.
struct PcmAudio {
  int sample_rate = kTranscriptionSampleRate;
  int channels = 1;
  std::vector<int16_t> samples;

  size_t FrameCount() const {
    return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
  }
  double DurationSeconds() const {
    return sample_rate > 0
               ? static_cast<double>(FrameCount()) / static_cast<double>(sample_rate)
               : 0.0;
  }
};

// One bounded window of the source audio. Immutable once the Segmenter
// returns it; shares the source buffer instead of copying samples.
struct AudioChunk {
  int index = 0;
  double start_time = 0.0;  // seconds from the start of the source
  double duration = 0.0;    // seconds
  std::shared_ptr<const PcmAudio> source;
  size_t first_frame = 0;
  size_t frame_count = 0;

  int SampleRate() const { return source ? source->sample_rate : 0; }
  const int16_t* Samples() const {
    return source ? source->samples.data() + first_frame : nullptr;
  }
  size_t SampleCount() const { return frame_count; }
};

}  // namespace hush::audio

#endif  // HUSH_AUDIO_AUDIO_TYPES_HPP_
