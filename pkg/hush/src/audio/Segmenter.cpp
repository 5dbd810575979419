// Repository: Hush
// Component: Segmenter
// Purpose: Split mono PCM into bounded-length chunks with absolute offsets.
// Copyright (c) 2026 RetroVue

#include "hush/audio/Segmenter.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "hush/util/Errors.hpp"
#include "hush/util/Logger.hpp"

namespace hush::audio {

using hush::util::Logger;

std::vector<AudioChunk> SegmentAudio(std::shared_ptr<const PcmAudio> audio,
                                     double chunk_length_seconds) {
  if (!audio) {
    throw InvalidInputError("Segmenter: no audio");
  }
  if (audio->channels != 1) {
    throw InvalidInputError("Segmenter: expected mono audio (1 channel), got " +
                            std::to_string(audio->channels) + " channels");
  }
  if (audio->sample_rate <= 0) {
    throw InvalidInputError("Segmenter: invalid sample rate " +
                            std::to_string(audio->sample_rate));
  }

  const double requested_frames = chunk_length_seconds * audio->sample_rate;
  if (!std::isfinite(requested_frames) || requested_frames < 1.0) {
    std::ostringstream oss;
    oss << "Segmenter: chunk length must be positive and finite, got " << chunk_length_seconds;
    throw ConfigError(oss.str());
  }

  const size_t total_frames = audio->FrameCount();
  // A window longer than the audio is one window over all of it.
  const size_t frames_per_chunk =
      requested_frames >= static_cast<double>(total_frames)
          ? std::max<size_t>(total_frames, 1)
          : static_cast<size_t>(requested_frames);
  const size_t total_chunks = (total_frames + frames_per_chunk - 1) / frames_per_chunk;
  const double rate = static_cast<double>(audio->sample_rate);

  std::vector<AudioChunk> chunks;
  chunks.reserve(total_chunks);

  for (size_t index = 0; index < total_chunks; ++index) {
    const size_t start_frame = index * frames_per_chunk;
    const size_t frames = std::min(frames_per_chunk, total_frames - start_frame);
    const double duration = static_cast<double>(frames) / rate;

    if (duration < kMinChunkDurationSeconds) {
      std::ostringstream oss;
      oss << "[Segmenter] dropping chunk " << index << " duration=" << duration
          << "s (below " << kMinChunkDurationSeconds << "s floor)";
      Logger::Debug(oss.str());
      continue;
    }

    AudioChunk chunk;
    chunk.index = static_cast<int>(index);
    chunk.start_time = static_cast<double>(start_frame) / rate;
    chunk.duration = duration;
    chunk.source = audio;
    chunk.first_frame = start_frame;
    chunk.frame_count = frames;
    chunks.push_back(std::move(chunk));
  }

  std::ostringstream oss;
  oss << "[Segmenter] total_frames=" << total_frames << " chunk_length_s="
      << chunk_length_seconds << " chunks=" << chunks.size();
  Logger::Debug(oss.str());
  return chunks;
}

}  // namespace hush::audio
