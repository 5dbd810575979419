// Repository: Hush
// Component: libav Support Implementation
// Copyright (c) 2026 RetroVue

#include "hush/media/LibavSupport.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libswresample/swresample.h>
}

#include "hush/util/Errors.hpp"

namespace hush::media {

void FormatContextCloser::operator()(AVFormatContext* ctx) const {
  if (ctx) avformat_close_input(&ctx);
}

void CodecContextFreer::operator()(AVCodecContext* ctx) const {
  if (ctx) avcodec_free_context(&ctx);
}

void FrameFreer::operator()(AVFrame* frame) const {
  if (frame) av_frame_free(&frame);
}

void PacketFreer::operator()(AVPacket* packet) const {
  if (packet) av_packet_free(&packet);
}

void SwrFreer::operator()(SwrContext* swr) const {
  if (swr) swr_free(&swr);
}

std::string AvErrorString(int errnum) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, errbuf, sizeof(errbuf));
  return errbuf;
}

FormatContextPtr OpenInput(const std::string& path) {
  AVFormatContext* raw = nullptr;
  int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    throw ExternalToolError("libavformat", "cannot open " + path + ": " + AvErrorString(ret));
  }
  FormatContextPtr ctx(raw);
  ret = avformat_find_stream_info(ctx.get(), nullptr);
  if (ret < 0) {
    throw ExternalToolError("libavformat",
                            "cannot read stream info for " + path + ": " + AvErrorString(ret));
  }
  return ctx;
}

}  // namespace hush::media
