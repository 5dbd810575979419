// Repository: Hush
// Component: Segmenter
// Purpose: Split mono PCM into bounded-length chunks with absolute offsets.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_AUDIO_SEGMENTER_HPP_
#define HUSH_AUDIO_SEGMENTER_HPP_

#include <memory>
#include <vector>

#include "hush/audio/AudioTypes.hpp"

namespace hush::audio {

// Windows shorter than this are dropped; transcription backends reject them.
constexpr double kMinChunkDurationSeconds = 0.11;

// Divides the audio into ceil(frames / frames_per_chunk) windows of
// chunk_length_seconds (last one may be shorter). A window below
// kMinChunkDurationSeconds is not emitted, but its index is still consumed
// so indices stay stable.
//
// Throws InvalidInputError if the audio is not single-channel,
// ConfigError if chunk_length_seconds is not positive.
std::vector<AudioChunk> SegmentAudio(std::shared_ptr<const PcmAudio> audio,
                                     double chunk_length_seconds);

}  // namespace hush::audio

#endif  // HUSH_AUDIO_SEGMENTER_HPP_
