// Repository: Hush
// Component: MediaRemuxer
// Purpose: Applies a CensorPlan by running ffmpeg.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_MEDIA_MEDIA_REMUXER_HPP_
#define HUSH_MEDIA_MEDIA_REMUXER_HPP_

#include <string>
#include <vector>

#include "hush/censor/CensorCompiler.hpp"

namespace hush::media {

// Throws ExternalToolError on failure.
class IMediaRemuxer {
 public:
  virtual ~IMediaRemuxer() = default;
  virtual void Remux(const std::string& input_path, const censor::CensorPlan& plan,
                     const std::string& output_path) = 0;
};

class FFmpegRemuxer : public IMediaRemuxer {
 public:
  explicit FFmpegRemuxer(std::string ffmpeg_binary = "ffmpeg");

  // ffmpeg -hide_banner -y -i <input> <plan args> <output>
  std::vector<std::string> BuildCommand(const std::string& input_path,
                                        const censor::CensorPlan& plan,
                                        const std::string& output_path) const;

  // Non-zero exit, signal, or missing/empty output -> ExternalToolError.
  void Remux(const std::string& input_path, const censor::CensorPlan& plan,
             const std::string& output_path) override;

 private:
  std::string ffmpeg_binary_;
};

}  // namespace hush::media

#endif  // HUSH_MEDIA_MEDIA_REMUXER_HPP_
