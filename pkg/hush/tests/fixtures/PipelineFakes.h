#ifndef HUSH_TESTS_FIXTURES_PIPELINE_FAKES_H_
#define HUSH_TESTS_FIXTURES_PIPELINE_FAKES_H_

#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "hush/audio/AudioTypes.hpp"
#include "hush/censor/CensorCompiler.hpp"
#include "hush/censor/MediaProbe.hpp"
#include "hush/media/AudioExtractor.hpp"
#include "hush/media/MediaRemuxer.hpp"

namespace hush::tests::fixtures
{

class StaticMediaProbe : public censor::IMediaProbe
{
public:
  explicit StaticMediaProbe(censor::MediaProbeResult result) : result_(std::move(result)) {}

  censor::MediaProbeResult Probe(const std::string& path) override
  {
    probed_.push_back(path);
    return result_;
  }

  const std::vector<std::string>& Probed() const { return probed_; }

private:
  censor::MediaProbeResult result_;
  std::vector<std::string> probed_;
};

// Silent mono audio of a fixed duration.
class SilentAudioExtractor : public media::IAudioExtractor
{
public:
  explicit SilentAudioExtractor(double seconds) : seconds_(seconds) {}

  audio::PcmAudio Extract(const std::string&) override
  {
    ++calls_;
    audio::PcmAudio pcm;
    pcm.sample_rate = audio::kTranscriptionSampleRate;
    pcm.channels = 1;
    pcm.samples.assign(static_cast<size_t>(seconds_ * pcm.sample_rate), 0);
    return pcm;
  }

  int Calls() const { return calls_; }

private:
  double seconds_;
  int calls_ = 0;
};

// Captures the plan and writes a placeholder output file.
class RecordingRemuxer : public media::IMediaRemuxer
{
public:
  void Remux(const std::string& input_path, const censor::CensorPlan& plan,
             const std::string& output_path) override
  {
    inputs_.push_back(input_path);
    plans_.push_back(plan);
    std::ofstream out(output_path, std::ios::binary);
    out << "remuxed";
  }

  const std::vector<censor::CensorPlan>& Plans() const { return plans_; }
  const std::vector<std::string>& Inputs() const { return inputs_; }

private:
  std::vector<std::string> inputs_;
  std::vector<censor::CensorPlan> plans_;
};

// MP4-like probe: one h264 video stream and one aac audio stream.
inline censor::MediaProbeResult MakeProbe(const std::string& audio_title = "")
{
  censor::MediaProbeResult probe;
  probe.format_name = "mov,mp4,m4a,3gp,3g2,mj2";

  censor::StreamInfo video;
  video.index = 0;
  video.type = censor::StreamType::kVideo;
  video.codec_name = "h264";
  probe.streams.push_back(video);

  censor::StreamInfo audio;
  audio.index = 1;
  audio.type = censor::StreamType::kAudio;
  audio.codec_name = "aac";
  audio.bit_rate = 128000;
  audio.channels = 2;
  audio.sample_rate = 48000;
  audio.title = audio_title;
  probe.streams.push_back(audio);
  return probe;
}

}  // namespace hush::tests::fixtures

#endif  // HUSH_TESTS_FIXTURES_PIPELINE_FAKES_H_
