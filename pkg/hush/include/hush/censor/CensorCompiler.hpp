// Repository: Hush
// Component: CensorCompiler
// Purpose: Spans + probed stream metadata -> ffmpeg filter graph, stream map
//          and codec plan.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_CENSOR_CENSOR_COMPILER_HPP_
#define HUSH_CENSOR_CENSOR_COMPILER_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "hush/censor/MediaProbe.hpp"
#include "hush/detect/ProfanityTypes.hpp"

namespace hush::censor {

// Trailing pad added to every muted interval (trailing consonant energy).
constexpr double kMuteEndPaddingSeconds = 0.150;
constexpr double kMinBleepDurationSeconds = 0.1;
constexpr int kBleepToneHz = 1000;
constexpr int kDefaultBleepSampleRate = 16000;

// Title of the appended clean audio stream; also the already-processed marker.
constexpr const char* kCleanMarkerTitle = "Clean";
constexpr const char* kFilteredAudioLabel = "aout";
constexpr const char* kDefaultAudioEncoder = "aac";

// "volume=enable='between(t,S,E)':volume=0" per span, comma-joined, with
// S = max(0, start), E = max(S, end) + 0.150. Empty for no spans.
std::string BuildMuteFilter(const std::vector<detect::ProfanitySpan>& spans);

// Full filter_complex: the primary audio plus one delayed 1 kHz tone per
// span, summed by amix without normalization into [aout]. Empty for no spans.
std::string BuildBleepFilter(const std::vector<detect::ProfanitySpan>& spans, int sample_rate);

// aac/ac3/eac3 map to themselves; anything else maps to aac (warned when
// non-empty).
std::string EncoderForCodecName(const std::string& codec_name);

// True when any stream's title equals the clean marker (trimmed,
// case-insensitive).
bool HasCleanMarker(const MediaProbeResult& probe);

// .mkv / .mka (case-insensitive).
bool IsMatroskaOutput(const std::string& output_path);

struct CensorPlan {
  bool pass_through = true;
  std::string filter_complex;      // Empty for pass-through
  std::vector<std::string> maps;   // Values for -map, in order
  bool copy_container_metadata = true;
  std::string encoder;             // Clean stream encoder
  std::optional<int64_t> bit_rate; // Clean stream bit rate
  int clean_audio_index = -1;      // Output audio index of the clean stream

  // Arguments between "-i <input>" and the output path.
  std::vector<std::string> ToFfmpegArgs() const;
};

// CensorCompiler is stateless apart from the mode; Compile() performs no I/O.
class CensorCompiler {
 public:
  explicit CensorCompiler(detect::CensorMode mode);

  // Throws InvalidInputError when spans are present but the probe found no
  // audio stream to filter.
  CensorPlan Compile(const std::vector<detect::ProfanitySpan>& spans,
                     const MediaProbeResult& probe,
                     const std::string& output_path) const;

 private:
  detect::CensorMode mode_;
};

}  // namespace hush::censor

#endif  // HUSH_CENSOR_CENSOR_COMPILER_HPP_
