// Repository: Hush
// Component: CensorCompiler Implementation
// Copyright (c) 2026 RetroVue

#include "hush/censor/CensorCompiler.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

#include "hush/util/Errors.hpp"
#include "hush/util/Logger.hpp"
#include "hush/util/Strings.hpp"

namespace hush::censor {

using hush::util::Logger;

namespace {

std::string FormatSeconds(double seconds) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.3f", seconds);
  return buf;
}

}  // namespace

std::string BuildMuteFilter(const std::vector<detect::ProfanitySpan>& spans) {
  std::ostringstream oss;
  bool first = true;
  for (const auto& span : spans) {
    const double start = std::max(0.0, span.start);
    const double end = std::max(start, span.end) + kMuteEndPaddingSeconds;
    if (!first) oss << ',';
    first = false;
    oss << "volume=enable='between(t," << FormatSeconds(start) << ',' << FormatSeconds(end)
        << ")':volume=0";
  }
  return oss.str();
}

std::string BuildBleepFilter(const std::vector<detect::ProfanitySpan>& spans, int sample_rate) {
  if (spans.empty()) return "";
  if (sample_rate <= 0) sample_rate = kDefaultBleepSampleRate;

  std::vector<std::string> chains;
  chains.push_back("[0:a:0]anull[a0]");

  std::string mix_inputs = "[a0]";
  for (size_t i = 0; i < spans.size(); ++i) {
    const double start = std::max(0.0, spans[i].start);
    const double end = std::max(start, spans[i].end);
    const double duration = std::max(kMinBleepDurationSeconds, end - start);
    const long long delay_ms = std::llround(start * 1000.0);

    std::ostringstream tone;
    tone << "aevalsrc=0.5*sin(2*PI*" << kBleepToneHz << "*t):s=" << sample_rate
         << ":d=" << FormatSeconds(duration) << "[tone" << i << "]";
    chains.push_back(tone.str());

    std::ostringstream delay;
    delay << "[tone" << i << "]adelay=" << delay_ms << '|' << delay_ms << "[b" << i << "]";
    chains.push_back(delay.str());

    mix_inputs += "[b" + std::to_string(i) + "]";
  }

  std::ostringstream mix;
  mix << mix_inputs << "amix=inputs=" << (spans.size() + 1) << ":normalize=0["
      << kFilteredAudioLabel << "]";
  chains.push_back(mix.str());

  std::ostringstream joined;
  for (size_t i = 0; i < chains.size(); ++i) {
    if (i > 0) joined << ';';
    joined << chains[i];
  }
  return joined.str();
}

std::string EncoderForCodecName(const std::string& codec_name) {
  const std::string codec = util::ToLower(util::Trim(codec_name));
  if (codec == "aac" || codec == "ac3" || codec == "eac3") {
    return codec;
  }
  if (!codec.empty()) {
    Logger::Warn("[CensorCompiler] unsupported input audio codec '" + codec +
                 "'; falling back to " + kDefaultAudioEncoder);
  }
  return kDefaultAudioEncoder;
}

bool HasCleanMarker(const MediaProbeResult& probe) {
  const std::string marker = util::ToLower(kCleanMarkerTitle);
  for (const auto& stream : probe.streams) {
    if (util::ToLower(util::Trim(stream.title)) == marker) {
      return true;
    }
  }
  return false;
}

bool IsMatroskaOutput(const std::string& output_path) {
  const std::string lowered = util::ToLower(output_path);
  return util::EndsWith(lowered, ".mkv") || util::EndsWith(lowered, ".mka");
}

std::vector<std::string> CensorPlan::ToFfmpegArgs() const {
  std::vector<std::string> args;
  if (!filter_complex.empty()) {
    args.push_back("-filter_complex");
    args.push_back(filter_complex);
  }
  for (const auto& m : maps) {
    args.push_back("-map");
    args.push_back(m);
  }
  if (copy_container_metadata) {
    args.insert(args.end(), {"-map_metadata", "0", "-map_chapters", "0"});
  }
  args.insert(args.end(), {"-c", "copy"});

  if (!pass_through && clean_audio_index >= 0) {
    const std::string n = std::to_string(clean_audio_index);
    args.push_back("-c:a:" + n);
    args.push_back(encoder);
    if (bit_rate && *bit_rate > 0) {
      args.push_back("-b:a:" + n);
      args.push_back(std::to_string(*bit_rate));
    }
    args.push_back("-metadata:s:a:" + n);
    args.push_back(std::string("title=") + kCleanMarkerTitle);
  }
  return args;
}

CensorCompiler::CensorCompiler(detect::CensorMode mode) : mode_(mode) {}

CensorPlan CensorCompiler::Compile(const std::vector<detect::ProfanitySpan>& spans,
                                   const MediaProbeResult& probe,
                                   const std::string& output_path) const {
  CensorPlan plan;
  const bool matroska = IsMatroskaOutput(output_path);

  // Matroska keeps every input stream; other containers keep the first
  // video stream and all audio streams.
  if (matroska) {
    plan.maps.push_back("0");
  } else {
    if (probe.HasVideo()) plan.maps.push_back("0:v:0");
    plan.maps.push_back("0:a");
  }

  if (spans.empty()) {
    Logger::Info("[CensorCompiler] no spans; stream copy only");
    return plan;
  }

  const StreamInfo* primary = probe.PrimaryAudio();
  if (primary == nullptr) {
    throw InvalidInputError("input has no audio stream to censor");
  }

  plan.pass_through = false;
  if (mode_ == detect::CensorMode::kMute) {
    plan.filter_complex =
        "[0:a:0]" + BuildMuteFilter(spans) + "[" + kFilteredAudioLabel + "]";
  } else {
    const int rate = primary->sample_rate > 0 ? primary->sample_rate : kDefaultBleepSampleRate;
    plan.filter_complex = BuildBleepFilter(spans, rate);
  }
  plan.maps.push_back(std::string("[") + kFilteredAudioLabel + "]");
  plan.encoder = EncoderForCodecName(primary->codec_name);
  plan.bit_rate = primary->bit_rate;
  plan.clean_audio_index = probe.AudioStreamCount();

  std::ostringstream oss;
  oss << "[CensorCompiler] mode=" << detect::CensorModeName(mode_) << " spans=" << spans.size()
      << " encoder=" << plan.encoder << " clean_audio_index=" << plan.clean_audio_index
      << " container=" << (matroska ? "matroska" : "other");
  Logger::Info(oss.str());
  return plan;
}

}  // namespace hush::censor
