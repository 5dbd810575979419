// Repository: Hush
// Component: FFmpegAudioExtractor Implementation
// Purpose: Decode + resample the primary audio stream into memory.
// Copyright (c) 2026 RetroVue

#include "hush/media/AudioExtractor.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include "hush/media/LibavSupport.hpp"
#include "hush/util/Errors.hpp"
#include "hush/util/Logger.hpp"

namespace hush::media {

using hush::util::Logger;

namespace {

constexpr const char* kTool = "libav";

// Resampler bound to the source format of the frames it has seen so far.
class MonoResampler {
 public:
  explicit MonoResampler(int dst_rate) : dst_rate_(dst_rate) {}

  ~MonoResampler() { av_channel_layout_uninit(&src_layout_); }

  void Convert(const AVFrame* frame, std::vector<int16_t>& out) {
    if (!swr_ || frame->sample_rate != src_rate_ || frame->format != src_fmt_ ||
        av_channel_layout_compare(&frame->ch_layout, &src_layout_) != 0) {
      if (swr_) Flush(out);
      Init(frame);
    }
    Run(const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples, out);
  }

  void Flush(std::vector<int16_t>& out) {
    if (!swr_) return;
    for (;;) {
      const size_t before = out.size();
      Run(nullptr, 0, out);
      if (out.size() == before) break;
    }
  }

 private:
  void Init(const AVFrame* frame) {
    av_channel_layout_uninit(&src_layout_);
    if (frame->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
      av_channel_layout_default(&src_layout_, frame->ch_layout.nb_channels);
    } else {
      const int copy_ret = av_channel_layout_copy(&src_layout_, &frame->ch_layout);
      if (copy_ret < 0) {
        throw ExternalToolError(kTool, "channel layout copy failed: " + AvErrorString(copy_ret));
      }
    }
    src_rate_ = frame->sample_rate;
    src_fmt_ = frame->format;

    AVChannelLayout dst_layout;
    av_channel_layout_default(&dst_layout, 1);

    SwrContext* raw = nullptr;
    int ret = swr_alloc_set_opts2(&raw, &dst_layout, AV_SAMPLE_FMT_S16, dst_rate_, &src_layout_,
                                  static_cast<AVSampleFormat>(src_fmt_), src_rate_, 0, nullptr);
    av_channel_layout_uninit(&dst_layout);
    if (ret < 0 || raw == nullptr) {
      throw ExternalToolError(kTool, "swr_alloc_set_opts2 failed: " +
                                         (ret < 0 ? AvErrorString(ret) : std::string("null")));
    }
    swr_.reset(raw);
    ret = swr_init(swr_.get());
    if (ret < 0) {
      throw ExternalToolError(kTool, "swr_init failed: " + AvErrorString(ret));
    }

    std::ostringstream oss;
    oss << "[AudioExtractor] resampler " << src_rate_ << " Hz " << src_layout_.nb_channels
        << " ch fmt=" << av_get_sample_fmt_name(static_cast<AVSampleFormat>(src_fmt_)) << " -> "
        << dst_rate_ << " Hz mono s16";
    Logger::Debug(oss.str());
  }

  void Run(const uint8_t** in, int in_samples, std::vector<int16_t>& out) {
    const int64_t delay = swr_get_delay(swr_.get(), src_rate_);
    const int capacity = static_cast<int>(
        av_rescale_rnd(delay + in_samples, dst_rate_, src_rate_, AV_ROUND_UP));
    if (capacity <= 0) return;

    const size_t offset = out.size();
    out.resize(offset + static_cast<size_t>(capacity));
    uint8_t* out_ptr = reinterpret_cast<uint8_t*>(out.data() + offset);
    const int converted = swr_convert(swr_.get(), &out_ptr, capacity, in, in_samples);
    if (converted < 0) {
      out.resize(offset);
      throw ExternalToolError(kTool, "swr_convert failed: " + AvErrorString(converted));
    }
    out.resize(offset + static_cast<size_t>(converted));
  }

  int dst_rate_;
  SwrPtr swr_;
  AVChannelLayout src_layout_{};
  int src_rate_ = 0;
  int src_fmt_ = -1;
};

}  // namespace

FFmpegAudioExtractor::FFmpegAudioExtractor(int sample_rate) : sample_rate_(sample_rate) {
  if (sample_rate_ <= 0) {
    throw std::invalid_argument("FFmpegAudioExtractor: sample rate must be positive");
  }
}

audio::PcmAudio FFmpegAudioExtractor::Extract(const std::string& path) {
  FormatContextPtr fmt = OpenInput(path);

  const AVCodec* codec = nullptr;
  const int stream_index = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
  if (stream_index < 0 || codec == nullptr) {
    throw ExternalToolError(kTool, "no decodable audio stream in " + path);
  }

  CodecContextPtr dec(avcodec_alloc_context3(codec));
  if (!dec) {
    throw ExternalToolError(kTool, "avcodec_alloc_context3 failed");
  }
  int ret = avcodec_parameters_to_context(dec.get(), fmt->streams[stream_index]->codecpar);
  if (ret < 0) {
    throw ExternalToolError(kTool, "avcodec_parameters_to_context: " + AvErrorString(ret));
  }
  ret = avcodec_open2(dec.get(), codec, nullptr);
  if (ret < 0) {
    throw ExternalToolError(kTool, std::string("cannot open decoder ") + codec->name + ": " +
                                       AvErrorString(ret));
  }

  {
    std::ostringstream oss;
    oss << "[AudioExtractor] " << path << " stream=" << stream_index << " codec=" << codec->name
        << " rate=" << dec->sample_rate << " channels=" << dec->ch_layout.nb_channels;
    Logger::Info(oss.str());
  }

  PacketPtr packet(av_packet_alloc());
  FramePtr frame(av_frame_alloc());
  if (!packet || !frame) {
    throw ExternalToolError(kTool, "packet/frame allocation failed");
  }

  audio::PcmAudio pcm;
  pcm.sample_rate = sample_rate_;
  pcm.channels = 1;
  MonoResampler resampler(sample_rate_);

  auto drain = [&]() {
    for (;;) {
      const int r = avcodec_receive_frame(dec.get(), frame.get());
      if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return;
      if (r < 0) {
        throw ExternalToolError(kTool, "decode failed: " + AvErrorString(r));
      }
      resampler.Convert(frame.get(), pcm.samples);
      av_frame_unref(frame.get());
    }
  };

  while ((ret = av_read_frame(fmt.get(), packet.get())) >= 0) {
    if (packet->stream_index != stream_index) {
      av_packet_unref(packet.get());
      continue;
    }
    ret = avcodec_send_packet(dec.get(), packet.get());
    av_packet_unref(packet.get());
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      // Corrupt packets are skipped, as ffmpeg's CLI does.
      Logger::Debug("[AudioExtractor] send_packet: " + AvErrorString(ret));
      continue;
    }
    drain();
  }
  if (ret != AVERROR_EOF) {
    throw ExternalToolError(kTool, "read failed for " + path + ": " + AvErrorString(ret));
  }

  ret = avcodec_send_packet(dec.get(), nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    throw ExternalToolError(kTool, "decoder flush failed: " + AvErrorString(ret));
  }
  drain();
  resampler.Flush(pcm.samples);

  if (pcm.samples.empty()) {
    throw ExternalToolError(kTool, "no audio decoded from " + path);
  }

  std::ostringstream oss;
  oss << "[AudioExtractor] decoded " << pcm.DurationSeconds() << "s (" << pcm.samples.size()
      << " samples @ " << pcm.sample_rate << " Hz mono)";
  Logger::Info(oss.str());
  return pcm;
}

}  // namespace hush::media
