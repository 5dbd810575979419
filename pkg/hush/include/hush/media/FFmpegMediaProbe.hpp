// Repository: Hush
// Component: FFmpegMediaProbe
// Purpose: IMediaProbe over libavformat.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_MEDIA_FFMPEG_MEDIA_PROBE_HPP_
#define HUSH_MEDIA_FFMPEG_MEDIA_PROBE_HPP_

#include <string>

#include "hush/censor/MediaProbe.hpp"

namespace hush::media {

// Audio bit rate comes from the codec parameters, else from a Matroska
// "BPS" (or "BPS-<lang>") stream tag.
class FFmpegMediaProbe : public censor::IMediaProbe {
 public:
  censor::MediaProbeResult Probe(const std::string& path) override;
};

}  // namespace hush::media

#endif  // HUSH_MEDIA_FFMPEG_MEDIA_PROBE_HPP_
