// Repository: Hush
// Component: libav Support
// Purpose: RAII owners for libav handles and error-code formatting.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_MEDIA_LIBAV_SUPPORT_HPP_
#define HUSH_MEDIA_LIBAV_SUPPORT_HPP_

#include <memory>
#include <string>

struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace hush::media {

struct FormatContextCloser {
  void operator()(AVFormatContext* ctx) const;
};
struct CodecContextFreer {
  void operator()(AVCodecContext* ctx) const;
};
struct FrameFreer {
  void operator()(AVFrame* frame) const;
};
struct PacketFreer {
  void operator()(AVPacket* packet) const;
};
struct SwrFreer {
  void operator()(SwrContext* swr) const;
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextCloser>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextFreer>;
using FramePtr = std::unique_ptr<AVFrame, FrameFreer>;
using PacketPtr = std::unique_ptr<AVPacket, PacketFreer>;
using SwrPtr = std::unique_ptr<SwrContext, SwrFreer>;

std::string AvErrorString(int errnum);

// avformat_open_input + avformat_find_stream_info.
// Throws ExternalToolError("libavformat", ...) on failure.
FormatContextPtr OpenInput(const std::string& path);

}  // namespace hush::media

#endif  // HUSH_MEDIA_LIBAV_SUPPORT_HPP_
