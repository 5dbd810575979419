// Repository: Hush
// Component: MediaRemuxer Implementation
// Copyright (c) 2026 RetroVue

#include "hush/media/MediaRemuxer.hpp"

#include <filesystem>
#include <sstream>

#include "hush/media/ProcessRunner.hpp"
#include "hush/util/Errors.hpp"
#include "hush/util/Logger.hpp"

namespace hush::media {

using hush::util::Logger;

FFmpegRemuxer::FFmpegRemuxer(std::string ffmpeg_binary)
    : ffmpeg_binary_(std::move(ffmpeg_binary)) {}

std::vector<std::string> FFmpegRemuxer::BuildCommand(const std::string& input_path,
                                                     const censor::CensorPlan& plan,
                                                     const std::string& output_path) const {
  std::vector<std::string> argv = {ffmpeg_binary_, "-hide_banner", "-y", "-i", input_path};
  const std::vector<std::string> plan_args = plan.ToFfmpegArgs();
  argv.insert(argv.end(), plan_args.begin(), plan_args.end());
  argv.push_back(output_path);
  return argv;
}

void FFmpegRemuxer::Remux(const std::string& input_path, const censor::CensorPlan& plan,
                          const std::string& output_path) {
  const std::vector<std::string> argv = BuildCommand(input_path, plan, output_path);
  Logger::Info("[Remux] " + FormatCommandLine(argv));

  const ProcessResult result = RunProcess(argv);
  if (result.term_signal != 0) {
    throw ExternalToolError(ffmpeg_binary_,
                            "killed by signal " + std::to_string(result.term_signal), -1,
                            result.stderr_text);
  }
  if (result.exit_code != 0) {
    throw ExternalToolError(ffmpeg_binary_, "muxing failed", result.exit_code,
                            result.stderr_text);
  }

  std::error_code ec;
  const auto size = std::filesystem::file_size(output_path, ec);
  if (ec || size == 0) {
    throw ExternalToolError(ffmpeg_binary_, "did not produce output " + output_path, 0,
                            result.stderr_text);
  }

  std::ostringstream oss;
  oss << "[Remux] wrote " << output_path << " (" << size << " bytes)";
  Logger::Info(oss.str());
}

}  // namespace hush::media
