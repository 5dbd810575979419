// Repository: Hush
// Component: WAV File I/O
// Purpose: PCM16 RIFF/WAVE encode, write and read.
// Copyright (c) 2026 RetroVue

#include "hush/audio/WavFile.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "hush/util/Errors.hpp"

namespace hush::audio {

namespace {

void PutU16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

void PutTag(std::vector<uint8_t>& out, const char* tag) {
  out.insert(out.end(), tag, tag + 4);
}

uint16_t GetU16(const std::vector<uint8_t>& in, size_t pos) {
  return static_cast<uint16_t>(in[pos] | (in[pos + 1] << 8));
}

uint32_t GetU32(const std::vector<uint8_t>& in, size_t pos) {
  return static_cast<uint32_t>(in[pos]) |
         (static_cast<uint32_t>(in[pos + 1]) << 8) |
         (static_cast<uint32_t>(in[pos + 2]) << 16) |
         (static_cast<uint32_t>(in[pos + 3]) << 24);
}

constexpr size_t kHeaderBytes = 44;

}  // namespace

std::vector<uint8_t> EncodeWav(const int16_t* samples, size_t frame_count,
                               int sample_rate, int channels) {
  const uint32_t data_bytes =
      static_cast<uint32_t>(frame_count * static_cast<size_t>(channels) * sizeof(int16_t));
  const uint16_t block_align = static_cast<uint16_t>(channels * sizeof(int16_t));

  std::vector<uint8_t> out;
  out.reserve(kHeaderBytes + data_bytes);
  PutTag(out, "RIFF");
  PutU32(out, 36 + data_bytes);
  PutTag(out, "WAVE");
  PutTag(out, "fmt ");
  PutU32(out, 16);  // PCM fmt chunk size
  PutU16(out, 1);   // WAVE_FORMAT_PCM
  PutU16(out, static_cast<uint16_t>(channels));
  PutU32(out, static_cast<uint32_t>(sample_rate));
  PutU32(out, static_cast<uint32_t>(sample_rate) * block_align);
  PutU16(out, block_align);
  PutU16(out, 16);  // bits per sample
  PutTag(out, "data");
  PutU32(out, data_bytes);

  // WAV is little-endian; so is every platform we build for.
  const auto* bytes = reinterpret_cast<const uint8_t*>(samples);
  if (data_bytes > 0 && bytes != nullptr) {
    out.insert(out.end(), bytes, bytes + data_bytes);
  }
  return out;
}

std::vector<uint8_t> EncodeWav(const AudioChunk& chunk) {
  return EncodeWav(chunk.Samples(), chunk.SampleCount(), chunk.SampleRate(), 1);
}

void WriteWavFile(const std::string& path, const int16_t* samples,
                  size_t frame_count, int sample_rate, int channels) {
  std::vector<uint8_t> bytes = EncodeWav(samples, frame_count, sample_rate, channels);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("WavFile: cannot open " + path + " for writing");
  }
  out.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    throw std::runtime_error("WavFile: write failed " + path);
  }
}

PcmAudio ReadWavFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("WavFile: cannot open " + path);
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());

  if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
      std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
    throw InvalidInputError("not a RIFF/WAVE file: " + path);
  }

  PcmAudio audio;
  bool have_fmt = false;
  size_t pos = 12;
  // Walk chunks; fmt must precede data.
  while (pos + 8 <= bytes.size()) {
    const uint32_t chunk_size = GetU32(bytes, pos + 4);
    const size_t body = pos + 8;
    if (std::memcmp(bytes.data() + pos, "fmt ", 4) == 0) {
      if (chunk_size < 16 || body + 16 > bytes.size()) {
        throw InvalidInputError("truncated fmt chunk: " + path);
      }
      const uint16_t format = GetU16(bytes, body);
      audio.channels = GetU16(bytes, body + 2);
      audio.sample_rate = static_cast<int>(GetU32(bytes, body + 4));
      const uint16_t bits = GetU16(bytes, body + 14);
      if (format != 1 || bits != 16) {
        throw InvalidInputError("only PCM16 WAV is supported: " + path);
      }
      have_fmt = true;
    } else if (std::memcmp(bytes.data() + pos, "data", 4) == 0) {
      if (!have_fmt) {
        throw InvalidInputError("data chunk before fmt chunk: " + path);
      }
      const size_t available = std::min<size_t>(chunk_size, bytes.size() - body);
      audio.samples.resize(available / sizeof(int16_t));
      std::memcpy(audio.samples.data(), bytes.data() + body,
                  audio.samples.size() * sizeof(int16_t));
      return audio;
    }
    pos = body + chunk_size + (chunk_size & 1u);
  }
  throw InvalidInputError("no data chunk: " + path);
}

}  // namespace hush::audio
