// Repository: Hush
// Component: Media Probe Interface
// Purpose: Stream metadata needed to plan the censor remux and to detect
//          already-processed inputs.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_CENSOR_MEDIA_PROBE_HPP_
#define HUSH_CENSOR_MEDIA_PROBE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hush::censor {

enum class StreamType { kVideo, kAudio, kSubtitle, kData, kAttachment, kUnknown };

const char* StreamTypeName(StreamType type);

struct StreamInfo {
  int index = 0;
  StreamType type = StreamType::kUnknown;
  std::string codec_name;             // lowercase, e.g. "aac"
  std::optional<int64_t> bit_rate;    // bits per second
  int channels = 0;
  int sample_rate = 0;
  std::string title;                  // "title" tag, may be empty
};

struct MediaProbeResult {
  std::string format_name;  // e.g. "matroska,webm", "mov,mp4,m4a,3gp,3g2,mj2"
  std::vector<StreamInfo> streams;

  size_t StreamCount() const { return streams.size(); }
  int AudioStreamCount() const;
  bool HasVideo() const;
  // First audio stream (0:a:0), or nullptr.
  const StreamInfo* PrimaryAudio() const;
};

// Throws ExternalToolError when the input cannot be opened or read.
class IMediaProbe {
 public:
  virtual ~IMediaProbe() = default;
  virtual MediaProbeResult Probe(const std::string& path) = 0;
};

}  // namespace hush::censor

#endif  // HUSH_CENSOR_MEDIA_PROBE_HPP_
