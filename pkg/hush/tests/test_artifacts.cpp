// Repository: Hush
// Component: Artifact Tests
// Purpose: Censor log, masked subtitles, clean transcript and transcript
//          JSON output.
// Copyright (c) 2026 RetroVue

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hush/censor/Artifacts.hpp"
#include "hush/transcript/TranscriptJson.hpp"

namespace hush::censor::testing {
namespace {

using json = nlohmann::json;

detect::ProfanitySpan SpanWith(const std::vector<detect::ProfanityHit>& hits) {
  detect::ProfanitySpan span;
  span.start = hits.front().start;
  span.end = hits.back().end;
  span.hits = hits;
  for (const auto& h : hits) span.max_confidence = std::max(span.max_confidence, h.confidence);
  return span;
}

detect::ProfanityHit Hit(const std::string& word, double start, double end, double confidence,
                         const std::string& context) {
  detect::ProfanityHit hit;
  hit.word = word;
  hit.start = start;
  hit.end = end;
  hit.confidence = confidence;
  hit.context = context;
  return hit;
}

// =============================================================================
// Censor log
// =============================================================================

TEST(CensorLogTest, OneEntryPerSpanFromRepresentativeHit) {
  const auto span = SpanWith({Hit("shit", 1.0, 1.2, 0.7, "oh shit damn"),
                              Hit("damn", 1.25, 1.4, 0.95, "oh shit damn")});
  json log = BuildCensorLog({span});
  ASSERT_TRUE(log.is_array());
  ASSERT_EQ(log.size(), 1u);
  EXPECT_EQ(log[0]["word"], "damn");
  EXPECT_DOUBLE_EQ(log[0]["start"].get<double>(), 1.0);
  EXPECT_DOUBLE_EQ(log[0]["end"].get<double>(), 1.4);
  EXPECT_DOUBLE_EQ(log[0]["confidence"].get<double>(), 0.95);
  EXPECT_EQ(log[0]["context"], "oh shit damn");
}

TEST(CensorLogTest, EmptySpansGiveEmptyArray) {
  EXPECT_EQ(BuildCensorLog({}).dump(), "[]");
}

// =============================================================================
// Subtitles
// =============================================================================

TEST(SubtitleTest, TimestampFormat) {
  EXPECT_EQ(FormatSrtTimestamp(0.0), "00:00:00,000");
  EXPECT_EQ(FormatSrtTimestamp(3661.5), "01:01:01,500");
  EXPECT_EQ(FormatSrtTimestamp(59.9996), "00:01:00,000");
  EXPECT_EQ(FormatSrtTimestamp(-3.0), "00:00:00,000");
}

TEST(SubtitleTest, MaskingIsWholeWordAndCaseInsensitive) {
  EXPECT_EQ(MaskContext("Damn, that damned dam", {Hit("damn", 0, 1, 1, "")}),
            "****, that damned dam");
}

TEST(SubtitleTest, MaskingTreatsUnicodePunctuationAsBoundary) {
  const std::string open_quote = "\xE2\x80\x9C";
  const std::string close_quote = "\xE2\x80\x9D";
  const std::string inverted_question = "\xC2\xBF";
  const std::string ellipsis = "\xE2\x80\xA6";
  const std::string e_acute = "\xC3\xA9";

  const std::string context = open_quote + "Damn" + close_quote + " " + inverted_question +
                              "damn" + ellipsis + " damn" + e_acute;
  EXPECT_EQ(MaskContext(context, {Hit("damn", 0, 1, 1, "")}),
            open_quote + "****" + close_quote + " " + inverted_question + "****" + ellipsis +
                " damn" + e_acute);
}

TEST(SubtitleTest, CuesAreNumberedAndMasked) {
  const auto first = SpanWith({Hit("damn", 1.0, 1.5, 0.9, "well damn it")});
  const auto second = SpanWith({Hit("crap", 62.25, 62.75, 0.8, "Crap! again")});
  const auto no_context = SpanWith({Hit("shit", 90.0, 90.5, 0.8, "")});

  EXPECT_EQ(BuildSubtitles({first, no_context, second}),
            "1\n00:00:01,000 --> 00:00:01,500\nwell **** it\n"
            "\n"
            "2\n00:01:02,250 --> 00:01:02,750\n****! again\n");
  EXPECT_EQ(BuildSubtitles({}), "");
}

// =============================================================================
// Clean transcript
// =============================================================================

TEST(CleanTranscriptTest, MasksWordsTouchingSpans) {
  transcript::TranscriptionResult result;
  transcript::TranscriptSegment with_words;
  with_words.text = "well damn it";
  with_words.words = {{"well", 0.0, 0.4, 0.9}, {"damn", 1.0, 1.5, 0.9}, {"it", 1.6, 1.8, 0.9}};
  transcript::TranscriptSegment text_only;
  text_only.text = "plain text here";
  result.segments = {with_words, text_only};

  const auto span = SpanWith({Hit("damn", 1.0, 1.5, 0.9, "well damn it")});
  EXPECT_EQ(BuildCleanTranscript(result, {span}), "well **** it\nplain text here");
  EXPECT_EQ(BuildCleanTranscript(result, {}), "well damn it\nplain text here");
}

// =============================================================================
// Transcript JSON
// =============================================================================

TEST(TranscriptJsonTest, SerializesSegmentsAndWords) {
  transcript::TranscriptionResult result;
  result.language = "en";
  transcript::TranscriptSegment seg;
  seg.id = 3;
  seg.start = 30.0;
  seg.end = 31.0;
  seg.text = "hi there";
  seg.words = {{"hi", 30.0, 30.4, 0.8}, {"there", 30.5, 31.0, 1.0}};
  seg.avg_confidence = 0.9;
  seg.chunk_index = 1;
  result.segments.push_back(seg);

  const json doc = transcript::TranscriptToJson(result);
  EXPECT_EQ(doc["language"], "en");
  ASSERT_EQ(doc["segments"].size(), 1u);
  const json& s = doc["segments"][0];
  EXPECT_EQ(s["id"], 3);
  EXPECT_EQ(s["chunk_index"], 1);
  EXPECT_EQ(s["text"], "hi there");
  EXPECT_DOUBLE_EQ(s["avg_confidence"].get<double>(), 0.9);
  ASSERT_EQ(s["words"].size(), 2u);
  EXPECT_EQ(s["words"][1]["word"], "there");
  EXPECT_DOUBLE_EQ(s["words"][0]["end"].get<double>(), 30.4);

  const auto path = std::filesystem::temp_directory_path() / "hush_transcript.json";
  transcript::SaveTranscriptJson(result, path.string());
  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_EQ(json::parse(content.str()), doc);
  std::filesystem::remove(path);
}

TEST(TranscriptJsonTest, TruncatedUtf8IsReplacedNotFatal) {
  transcript::TranscriptionResult result;
  result.language = "es";
  transcript::TranscriptSegment seg;
  seg.text = "hola \xC3";
  seg.words = {{"hola", 0.0, 0.4, 0.9}, {"\xC3", 0.4, 0.5, 0.9}};
  result.segments.push_back(seg);

  const auto path = std::filesystem::temp_directory_path() / "hush_transcript_utf8.json";
  ASSERT_NO_THROW(transcript::SaveTranscriptJson(result, path.string()));
  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  const json doc = json::parse(content.str());
  EXPECT_EQ(doc["segments"][0]["text"], "hola \xEF\xBF\xBD");
  EXPECT_EQ(doc["segments"][0]["words"][1]["word"], "\xEF\xBF\xBD");
  std::filesystem::remove(path);
}

TEST(CensorLogTest, DumpSurvivesInvalidUtf8Context) {
  const std::string dumped = transcript::DumpArtifactJson(
      BuildCensorLog({SpanWith({Hit("damn", 1.0, 1.2, 0.9, "damn \xE2\x80")})}));
  EXPECT_EQ(dumped.back(), '\n');
  const json log = json::parse(dumped);
  ASSERT_EQ(log.size(), 1u);
  EXPECT_EQ(log[0]["context"], "damn \xEF\xBF\xBD");
}

TEST(ArtifactFileTest, WriteToMissingDirectoryThrows) {
  EXPECT_THROW(WriteTextFile("/nonexistent_hush_dir/x.txt", "x"), std::runtime_error);
}

}  // namespace
}  // namespace hush::censor::testing
