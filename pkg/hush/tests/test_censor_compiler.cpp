// Repository: Hush
// Component: Censor Compiler Tests
// Purpose: Mute/bleep filter graphs, stream mapping per container, clean
//          marker detection and the remux command line.
// Copyright (c) 2026 RetroVue

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fixtures/PipelineFakes.h"
#include "hush/censor/CensorCompiler.hpp"
#include "hush/media/MediaRemuxer.hpp"
#include "hush/util/Errors.hpp"

namespace hush::censor::testing {
namespace {

using hush::tests::fixtures::MakeProbe;

detect::ProfanitySpan Span(double start, double end) {
  detect::ProfanitySpan span;
  span.start = start;
  span.end = end;
  detect::ProfanityHit hit;
  hit.word = "damn";
  hit.start = start;
  hit.end = end;
  hit.confidence = 0.9;
  span.hits.push_back(hit);
  span.max_confidence = 0.9;
  return span;
}

// =============================================================================
// Filters
// =============================================================================

TEST(CensorFilterTest, MuteFilterPadsEndOfEachSpan) {
  EXPECT_EQ(BuildMuteFilter({Span(1.0, 2.0)}),
            "volume=enable='between(t,1.000,2.150)':volume=0");
  EXPECT_EQ(BuildMuteFilter({Span(0.5, 0.75), Span(3.25, 4.0)}),
            "volume=enable='between(t,0.500,0.900)':volume=0,"
            "volume=enable='between(t,3.250,4.150)':volume=0");
  EXPECT_EQ(BuildMuteFilter({}), "");
}

TEST(CensorFilterTest, MuteFilterClampsNegativeStart) {
  EXPECT_EQ(BuildMuteFilter({Span(-0.2, 0.3)}),
            "volume=enable='between(t,0.000,0.450)':volume=0");
}

TEST(CensorFilterTest, BleepFilterMixesDelayedTones) {
  const std::string filter = BuildBleepFilter({Span(1.0, 1.05), Span(2.5, 3.0)}, 48000);
  EXPECT_EQ(filter,
            "[0:a:0]anull[a0];"
            "aevalsrc=0.5*sin(2*PI*1000*t):s=48000:d=0.100[tone0];"
            "[tone0]adelay=1000|1000[b0];"
            "aevalsrc=0.5*sin(2*PI*1000*t):s=48000:d=0.500[tone1];"
            "[tone1]adelay=2500|2500[b1];"
            "[a0][b0][b1]amix=inputs=3:normalize=0[aout]");
}

TEST(CensorFilterTest, BleepFilterDefaultsSampleRate) {
  const std::string filter = BuildBleepFilter({Span(0.0, 1.0)}, 0);
  EXPECT_NE(filter.find(":s=16000:"), std::string::npos);
  EXPECT_EQ(BuildBleepFilter({}, 44100), "");
}

TEST(CensorFilterTest, EncoderFollowsInputCodec) {
  EXPECT_EQ(EncoderForCodecName("aac"), "aac");
  EXPECT_EQ(EncoderForCodecName("AC3"), "ac3");
  EXPECT_EQ(EncoderForCodecName("eac3"), "eac3");
  EXPECT_EQ(EncoderForCodecName("opus"), "aac");
  EXPECT_EQ(EncoderForCodecName(""), "aac");
}

TEST(CensorFilterTest, CleanMarkerMatchesAnyStreamTitle) {
  EXPECT_FALSE(HasCleanMarker(MakeProbe()));
  EXPECT_FALSE(HasCleanMarker(MakeProbe("Cleaner")));
  EXPECT_TRUE(HasCleanMarker(MakeProbe("Clean")));
  EXPECT_TRUE(HasCleanMarker(MakeProbe(" clean ")));
}

TEST(CensorFilterTest, MatroskaDetectionUsesExtension) {
  EXPECT_TRUE(IsMatroskaOutput("/out/movie.MKV"));
  EXPECT_TRUE(IsMatroskaOutput("audio.mka"));
  EXPECT_FALSE(IsMatroskaOutput("movie.mp4"));
  EXPECT_FALSE(IsMatroskaOutput("mkv"));
}

// =============================================================================
// Plans
// =============================================================================

TEST(CensorPlanTest, Mp4MuteAddsCleanTrackAfterOriginalAudio) {
  CensorPlan plan = CensorCompiler(detect::CensorMode::kMute)
                        .Compile({Span(1.0, 2.0)}, MakeProbe(), "out/movie.mp4");

  EXPECT_FALSE(plan.pass_through);
  EXPECT_EQ(plan.filter_complex,
            "[0:a:0]volume=enable='between(t,1.000,2.150)':volume=0[aout]");
  EXPECT_EQ(plan.clean_audio_index, 1);

  const std::vector<std::string> expected = {
      "-filter_complex", "[0:a:0]volume=enable='between(t,1.000,2.150)':volume=0[aout]",
      "-map", "0:v:0", "-map", "0:a", "-map", "[aout]",
      "-map_metadata", "0", "-map_chapters", "0",
      "-c", "copy",
      "-c:a:1", "aac", "-b:a:1", "128000",
      "-metadata:s:a:1", "title=Clean"};
  EXPECT_EQ(plan.ToFfmpegArgs(), expected);
}

TEST(CensorPlanTest, MatroskaKeepsAllStreams) {
  CensorPlan plan = CensorCompiler(detect::CensorMode::kBleep)
                        .Compile({Span(1.0, 2.0)}, MakeProbe(), "movie.mkv");
  ASSERT_EQ(plan.maps.size(), 2u);
  EXPECT_EQ(plan.maps[0], "0");
  EXPECT_EQ(plan.maps[1], "[aout]");
  EXPECT_NE(plan.filter_complex.find(":s=48000:"), std::string::npos);
}

TEST(CensorPlanTest, AudioOnlyInputSkipsVideoMap) {
  auto probe = MakeProbe();
  probe.streams.erase(probe.streams.begin());
  probe.streams[0].bit_rate.reset();
  CensorPlan plan =
      CensorCompiler(detect::CensorMode::kMute).Compile({Span(1.0, 2.0)}, probe, "out.m4a");

  EXPECT_EQ(plan.maps, (std::vector<std::string>{"0:a", "[aout]"}));
  const auto args = plan.ToFfmpegArgs();
  for (const auto& arg : args) {
    EXPECT_NE(arg.rfind("-b:a:", 0), 0u) << "unexpected bit rate flag " << arg;
  }
}

TEST(CensorPlanTest, NoSpansIsStreamCopy) {
  CensorPlan plan = CensorCompiler(detect::CensorMode::kMute).Compile({}, MakeProbe(), "o.mp4");
  EXPECT_TRUE(plan.pass_through);
  EXPECT_TRUE(plan.filter_complex.empty());
  EXPECT_EQ(plan.ToFfmpegArgs(),
            (std::vector<std::string>{"-map", "0:v:0", "-map", "0:a", "-map_metadata", "0",
                                      "-map_chapters", "0", "-c", "copy"}));
}

TEST(CensorPlanTest, SpansWithoutAudioAreInvalid) {
  MediaProbeResult probe = MakeProbe();
  probe.streams.pop_back();
  EXPECT_THROW(
      CensorCompiler(detect::CensorMode::kMute).Compile({Span(1.0, 2.0)}, probe, "o.mp4"),
      InvalidInputError);
}

TEST(CensorPlanTest, RemuxCommandWrapsPlanArgs) {
  CensorPlan plan = CensorCompiler(detect::CensorMode::kMute).Compile({}, MakeProbe(), "o.mkv");
  media::FFmpegRemuxer remuxer("/usr/bin/ffmpeg");
  const auto cmd = remuxer.BuildCommand("in.mp4", plan, "o.mkv");
  const std::vector<std::string> expected = {"/usr/bin/ffmpeg", "-hide_banner", "-y", "-i",
                                             "in.mp4", "-map", "0", "-map_metadata", "0",
                                             "-map_chapters", "0", "-c", "copy", "o.mkv"};
  EXPECT_EQ(cmd, expected);
}

}  // namespace
}  // namespace hush::censor::testing
