// Repository: Hush
// Component: Media Probe Result Helpers
// Copyright (c) 2026 RetroVue

#include "hush/censor/MediaProbe.hpp"

namespace hush::censor {

const char* StreamTypeName(StreamType type) {
  switch (type) {
    case StreamType::kVideo:
      return "video";
    case StreamType::kAudio:
      return "audio";
    case StreamType::kSubtitle:
      return "subtitle";
    case StreamType::kData:
      return "data";
    case StreamType::kAttachment:
      return "attachment";
    case StreamType::kUnknown:
      break;
  }
  return "unknown";
}

int MediaProbeResult::AudioStreamCount() const {
  int count = 0;
  for (const auto& s : streams) {
    if (s.type == StreamType::kAudio) ++count;
  }
  return count;
}

bool MediaProbeResult::HasVideo() const {
  for (const auto& s : streams) {
    if (s.type == StreamType::kVideo) return true;
  }
  return false;
}

const StreamInfo* MediaProbeResult::PrimaryAudio() const {
  for (const auto& s : streams) {
    if (s.type == StreamType::kAudio) return &s;
  }
  return nullptr;
}

}  // namespace hush::censor
