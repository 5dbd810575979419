// Repository: Hush
// Component: WAV File I/O
// Purpose: PCM16 RIFF/WAVE encode, write and read.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_AUDIO_WAV_FILE_HPP_
#define HUSH_AUDIO_WAV_FILE_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "hush/audio/AudioTypes.hpp"

namespace hush::audio {

// Encodes interleaved PCM16 frames as a complete WAV byte stream.
std::vector<uint8_t> EncodeWav(const int16_t* samples, size_t frame_count,
                               int sample_rate, int channels);

std::vector<uint8_t> EncodeWav(const AudioChunk& chunk);

// Throws std::runtime_error when the file cannot be written.
void WriteWavFile(const std::string& path, const int16_t* samples,
                  size_t frame_count, int sample_rate, int channels);

// Reads a PCM16 WAV file of any channel count.
// Throws InvalidInputError on malformed or non-PCM16 data,
// std::runtime_error when the file cannot be opened.
PcmAudio ReadWavFile(const std::string& path);

}  // namespace hush::audio

#endif  // HUSH_AUDIO_WAV_FILE_HPP_
