// Repository: Hush
// Component: Pipeline Tests
// Purpose: End-to-end run over fake media collaborators and a scripted
//          transcription backend.
// Copyright (c) 2026 RetroVue

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "fixtures/PipelineFakes.h"
#include "fixtures/RecordingWaitStrategy.h"
#include "fixtures/ScriptedBackend.h"
#include "hush/app/Pipeline.hpp"
#include "hush/util/Errors.hpp"

namespace hush::app::testing {
namespace {

namespace fs = std::filesystem;
using hush::tests::fixtures::MakeProbe;
using hush::tests::fixtures::MakeRawTranscript;
using hush::tests::fixtures::RecordingRemuxer;
using hush::tests::fixtures::RecordingWaitStrategy;
using hush::tests::fixtures::ScriptedBackend;
using hush::tests::fixtures::SilentAudioExtractor;
using hush::tests::fixtures::StaticMediaProbe;

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  return content.str();
}

class PipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("hush_pipeline_" + std::string(::testing::UnitTest::GetInstance()
                                                ->current_test_info()
                                                ->name()));
    fs::remove_all(dir_);

    config_.input_path = "input.mp4";
    config_.output_path = (dir_ / "output.mp4").string();
    config_.output_dir = (dir_ / "artifacts").string();
    config_.chunk_length_seconds = 2.0;
    config_.whisper_backend = transcript::BackendKind::kOpenAiApi;
    config_.whisper_model = "whisper-1";
    config_.max_workers = 2;
    config_.profanity_words = {"damn", "crap"};

    // Each 2 s chunk says "well damn it" over its first second.
    backend_ = std::make_shared<ScriptedBackend>(
        [](const audio::AudioChunk&, const std::string&, const std::string&) {
          return MakeRawTranscript("en", "well damn it", 0.0, 0.9, 0.95);
        });
    probe_ = std::make_shared<StaticMediaProbe>(MakeProbe());
    extractor_ = std::make_shared<SilentAudioExtractor>(4.0);
    remuxer_ = std::make_shared<RecordingRemuxer>();
  }

  void TearDown() override { fs::remove_all(dir_); }

  Pipeline MakePipeline() {
    PipelineCollaborators collaborators;
    collaborators.probe = probe_;
    collaborators.extractor = extractor_;
    collaborators.remuxer = remuxer_;
    collaborators.backend = backend_;
    collaborators.wait_strategy = std::make_shared<RecordingWaitStrategy>();
    return Pipeline(config_, collaborators);
  }

  fs::path dir_;
  AppConfig config_;
  std::shared_ptr<ScriptedBackend> backend_;
  std::shared_ptr<StaticMediaProbe> probe_;
  std::shared_ptr<SilentAudioExtractor> extractor_;
  std::shared_ptr<RecordingRemuxer> remuxer_;
};

TEST_F(PipelineTest, CensorsEveryChunkAndWritesArtifacts) {
  config_.emit_clean_transcript = true;
  config_.emit_subtitles = true;
  Pipeline pipeline = MakePipeline();

  EXPECT_EQ(pipeline.Run(), PipelineOutcome::kProcessed);
  EXPECT_EQ(pipeline.Summary().chunks, 2u);
  EXPECT_EQ(pipeline.Summary().segments, 2u);
  EXPECT_EQ(pipeline.Summary().hits, 2u);
  EXPECT_EQ(pipeline.Summary().spans, 2u);
  EXPECT_EQ(pipeline.Summary().language, "en");
  EXPECT_EQ(backend_->Calls().size(), 2u);

  ASSERT_EQ(remuxer_->Plans().size(), 1u);
  const censor::CensorPlan& plan = remuxer_->Plans()[0];
  EXPECT_FALSE(plan.pass_through);
  EXPECT_EQ(plan.filter_complex,
            "[0:a:0]volume=enable='between(t,0.300,0.750)':volume=0,"
            "volume=enable='between(t,2.300,2.750)':volume=0[aout]");
  EXPECT_EQ(plan.encoder, "aac");
  EXPECT_EQ(plan.clean_audio_index, 1);
  EXPECT_EQ(remuxer_->Inputs()[0], "input.mp4");

  const auto log = nlohmann::json::parse(ReadFile(pipeline.CensorLogPath()));
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0]["word"], "damn");
  EXPECT_EQ(log[1]["context"], "well damn it");

  const auto transcript = nlohmann::json::parse(ReadFile(pipeline.TranscriptPath()));
  EXPECT_EQ(transcript["language"], "en");
  EXPECT_EQ(transcript["segments"].size(), 2u);

  const std::string clean = ReadFile(pipeline.CleanTranscriptPath());
  EXPECT_NE(clean.find("****"), std::string::npos);
  EXPECT_EQ(clean.find("damn"), std::string::npos);
  const std::string srt = ReadFile(pipeline.SubtitlesPath());
  EXPECT_NE(srt.find("1\n00:00:00,300 --> 00:00:00,600\nwell **** it\n"), std::string::npos);
  EXPECT_NE(srt.find("2\n00:00:02,300 --> 00:00:02,600\n"), std::string::npos);
  EXPECT_TRUE(fs::exists(config_.output_path));
  EXPECT_FALSE(fs::exists(pipeline.DebugAudioDir()));
}

TEST_F(PipelineTest, OptionalArtifactsAreOffByDefault) {
  Pipeline pipeline = MakePipeline();
  pipeline.Run();
  EXPECT_TRUE(fs::exists(pipeline.TranscriptPath()));
  EXPECT_TRUE(fs::exists(pipeline.CensorLogPath()));
  EXPECT_FALSE(fs::exists(pipeline.CleanTranscriptPath()));
  EXPECT_FALSE(fs::exists(pipeline.SubtitlesPath()));
}

TEST_F(PipelineTest, CleanInputIsSkippedUnlessForced) {
  probe_ = std::make_shared<StaticMediaProbe>(MakeProbe("Clean"));
  Pipeline skipped = MakePipeline();
  EXPECT_EQ(skipped.Run(), PipelineOutcome::kSkippedAlreadyClean);
  EXPECT_EQ(extractor_->Calls(), 0);
  EXPECT_TRUE(backend_->Calls().empty());
  EXPECT_TRUE(remuxer_->Plans().empty());

  config_.force = true;
  Pipeline forced = MakePipeline();
  EXPECT_EQ(forced.Run(), PipelineOutcome::kProcessed);
  EXPECT_EQ(extractor_->Calls(), 1);
  EXPECT_EQ(remuxer_->Plans().size(), 1u);
}

TEST_F(PipelineTest, NoProfanityStillRemuxesAsStreamCopy) {
  config_.profanity_words = {"heck"};
  Pipeline pipeline = MakePipeline();
  pipeline.Run();

  ASSERT_EQ(remuxer_->Plans().size(), 1u);
  EXPECT_TRUE(remuxer_->Plans()[0].pass_through);
  EXPECT_EQ(ReadFile(pipeline.CensorLogPath()), "[]\n");
}

TEST_F(PipelineTest, FailedChunkDoesNotAbortTheRun) {
  backend_ = std::make_shared<ScriptedBackend>(
      [](const audio::AudioChunk& chunk, const std::string&, const std::string&) {
        if (chunk.index == 0) throw std::runtime_error("HTTP 500");
        return MakeRawTranscript("en", "oh crap", 0.0, 1.0, 0.9);
      });
  config_.max_retries = 1;
  Pipeline pipeline = MakePipeline();

  EXPECT_EQ(pipeline.Run(), PipelineOutcome::kProcessed);
  EXPECT_EQ(pipeline.Summary().segments, 1u);
  EXPECT_EQ(pipeline.Summary().spans, 1u);
  EXPECT_EQ(backend_->ModelsForChunk(0).size(), 2u);
}

TEST_F(PipelineTest, DebugDumpWritesChunkWavs) {
  config_.debug_dump_audio = true;
  Pipeline pipeline = MakePipeline();
  pipeline.Run();
  const fs::path debug_dir(pipeline.DebugAudioDir());
  EXPECT_TRUE(fs::exists(debug_dir / "audio.wav"));
  EXPECT_TRUE(fs::exists(debug_dir / "chunk_000.wav"));
  EXPECT_TRUE(fs::exists(debug_dir / "chunk_001.wav"));
}

TEST_F(PipelineTest, BleepModeBuildsMixedGraph) {
  config_.mode = detect::CensorMode::kBleep;
  Pipeline pipeline = MakePipeline();
  pipeline.Run();
  ASSERT_EQ(remuxer_->Plans().size(), 1u);
  const std::string& graph = remuxer_->Plans()[0].filter_complex;
  EXPECT_EQ(graph.rfind("[0:a:0]anull[a0];", 0), 0u);
  EXPECT_NE(graph.find("adelay=2300|2300"), std::string::npos);
  EXPECT_NE(graph.find("amix=inputs=3"), std::string::npos);
}

}  // namespace
}  // namespace hush::app::testing
