// Repository: Hush
// Component: FFmpegMediaProbe Implementation
// Copyright (c) 2026 RetroVue

#include "hush/media/FFmpegMediaProbe.hpp"

#include <optional>
#include <sstream>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
}

#include "hush/media/LibavSupport.hpp"
#include "hush/util/Logger.hpp"
#include "hush/util/Strings.hpp"

namespace hush::media {

using hush::util::Logger;

namespace {

censor::StreamType ToStreamType(AVMediaType type) {
  switch (type) {
    case AVMEDIA_TYPE_VIDEO:
      return censor::StreamType::kVideo;
    case AVMEDIA_TYPE_AUDIO:
      return censor::StreamType::kAudio;
    case AVMEDIA_TYPE_SUBTITLE:
      return censor::StreamType::kSubtitle;
    case AVMEDIA_TYPE_DATA:
      return censor::StreamType::kData;
    case AVMEDIA_TYPE_ATTACHMENT:
      return censor::StreamType::kAttachment;
    default:
      return censor::StreamType::kUnknown;
  }
}

std::string TagValue(const AVDictionary* metadata, const char* key, int flags = 0) {
  const AVDictionaryEntry* entry = av_dict_get(metadata, key, nullptr, flags);
  return entry != nullptr && entry->value != nullptr ? entry->value : "";
}

std::optional<int64_t> ParseBitRate(const std::string& text) {
  const std::string t = util::Trim(text);
  if (t.empty()) return std::nullopt;
  try {
    size_t pos = 0;
    const long long v = std::stoll(t, &pos);
    if (pos == t.size() && v > 0) return static_cast<int64_t>(v);
  } catch (const std::exception&) {
    Logger::Debug("[FFmpegMediaProbe] unparseable BPS tag: " + t);
  }
  return std::nullopt;
}

}  // namespace

censor::MediaProbeResult FFmpegMediaProbe::Probe(const std::string& path) {
  FormatContextPtr fmt = OpenInput(path);

  censor::MediaProbeResult result;
  if (fmt->iformat != nullptr && fmt->iformat->name != nullptr) {
    result.format_name = fmt->iformat->name;
  }

  for (unsigned int i = 0; i < fmt->nb_streams; ++i) {
    const AVStream* stream = fmt->streams[i];
    const AVCodecParameters* par = stream->codecpar;

    censor::StreamInfo info;
    info.index = static_cast<int>(i);
    info.type = ToStreamType(par->codec_type);
    info.codec_name = util::ToLower(avcodec_get_name(par->codec_id));
    info.title = TagValue(stream->metadata, "title");

    if (info.type == censor::StreamType::kAudio) {
      info.channels = par->ch_layout.nb_channels;
      info.sample_rate = par->sample_rate;
      if (par->bit_rate > 0) {
        info.bit_rate = par->bit_rate;
      } else {
        // Matroska muxers store statistics tags such as BPS / BPS-eng.
        info.bit_rate = ParseBitRate(TagValue(stream->metadata, "BPS", AV_DICT_IGNORE_SUFFIX));
      }
    }
    result.streams.push_back(std::move(info));
  }

  std::ostringstream oss;
  oss << "[FFmpegMediaProbe] " << path << " format=" << result.format_name
      << " streams=" << result.StreamCount() << " audio=" << result.AudioStreamCount();
  if (const censor::StreamInfo* primary = result.PrimaryAudio()) {
    oss << " primary_codec=" << primary->codec_name
        << " bit_rate=" << (primary->bit_rate ? std::to_string(*primary->bit_rate) : "n/a")
        << " sample_rate=" << primary->sample_rate;
  }
  Logger::Info(oss.str());
  return result;
}

}  // namespace hush::media
