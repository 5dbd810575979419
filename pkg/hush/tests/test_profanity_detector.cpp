// Repository: Hush
// Component: Profanity Detector Tests
// Purpose: Whole-word matching, confidence gating per mode, segment-text
//          fallback and term list parsing.
// Copyright (c) 2026 RetroVue

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "hush/detect/ProfanityDetector.hpp"
#include "hush/detect/TermList.hpp"
#include "hush/util/Errors.hpp"

namespace hush::detect::testing {
namespace {

using transcript::TranscriptionResult;
using transcript::TranscriptSegment;
using transcript::TranscriptWord;

TranscriptSegment WordSegment(int id, const std::vector<TranscriptWord>& words,
                              const std::string& text) {
  TranscriptSegment seg;
  seg.id = id;
  seg.start = words.empty() ? 0.0 : words.front().start;
  seg.end = words.empty() ? 0.0 : words.back().end;
  seg.text = text;
  seg.words = words;
  seg.avg_confidence = 0.9;
  return seg;
}

ProfanityDetector MakeDetector(const std::vector<std::string>& words,
                               CensorMode mode = CensorMode::kMute,
                               double min_confidence = 0.6) {
  DetectorConfig config;
  config.mode = mode;
  config.min_confidence = min_confidence;
  return ProfanityDetector(BuildTerms(words), config);
}

// =============================================================================
// Word path
// =============================================================================

TEST(ProfanityDetectorTest, MatchesWholeWordsOnly) {
  TranscriptionResult transcript;
  transcript.segments.push_back(WordSegment(
      0,
      {{"classy", 0.0, 0.4, 0.95}, {"ass", 0.4, 0.6, 0.95}, {"move", 0.6, 1.0, 0.95}},
      " classy ass move "));

  auto hits = MakeDetector({"ass"}).Detect(transcript);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].word, "ass");
  EXPECT_DOUBLE_EQ(hits[0].start, 0.4);
  EXPECT_DOUBLE_EQ(hits[0].end, 0.6);
  EXPECT_EQ(hits[0].context, "classy ass move");
}

TEST(ProfanityDetectorTest, PunctuationAndCaseAreNormalized) {
  TranscriptionResult transcript;
  transcript.segments.push_back(
      WordSegment(3, {{" Damn!", 2.0, 2.3, 0.8}, {"it", 2.3, 2.5, 0.8}}, "Damn! it"));
  transcript.segments[0].chunk_index = 2;

  auto hits = MakeDetector({"damn"}).Detect(transcript);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].word, "damn");
  EXPECT_EQ(hits[0].segment_id, 3);
  EXPECT_EQ(hits[0].chunk_index, 2);
  EXPECT_DOUBLE_EQ(hits[0].confidence, 0.8);
}

TEST(ProfanityDetectorTest, UnicodePunctuationIsStrippedFromWords) {
  const std::string quoted = "\xE2\x80\x9C" "shit" "\xE2\x80\x9D";  // curly quotes
  const std::string ellipsis = "shit" "\xE2\x80\xA6";
  const std::string dash = "shit" "\xE2\x80\x94";
  const std::string guillemets = "\xC2\xAB" "shit" "\xC2\xBB";

  for (const std::string& token : {quoted, ellipsis, dash, guillemets}) {
    TranscriptionResult transcript;
    transcript.segments.push_back(WordSegment(
        0, {{"well", 0.0, 0.4, 0.9}, {token, 0.4, 0.8, 0.9}}, "well " + token));

    auto hits = MakeDetector({"shit"}).Detect(transcript);
    ASSERT_EQ(hits.size(), 1u) << token;
    EXPECT_DOUBLE_EQ(hits[0].start, 0.4);
  }
}

TEST(ProfanityDetectorTest, NormalizeTokenKeepsNonAsciiLetters) {
  EXPECT_EQ(NormalizeToken("shit" "\xE2\x80\xA6"), "shit");
  EXPECT_EQ(NormalizeToken("\xE2\x80\x9C" "Damn" "\xE2\x80\x9D!"), "damn");
  EXPECT_EQ(NormalizeToken("don't"), "don't");
  // Right single quotation mark is punctuation, not an apostrophe.
  EXPECT_EQ(NormalizeToken("don" "\xE2\x80\x99" "t"), "dont");
  // "cabrón", "ñ" and CJK letters survive; a truncated sequence does not.
  EXPECT_EQ(NormalizeToken("cabr" "\xC3\xB3" "n,"), "cabr" "\xC3\xB3" "n");
  EXPECT_EQ(NormalizeToken("\xE5\x82\xBB" "\xE3\x80\x82"), "\xE5\x82\xBB");
  EXPECT_EQ(NormalizeToken("shit" "\xC3"), "shit");
}

TEST(ProfanityDetectorTest, WordCodePointClasses) {
  EXPECT_TRUE(IsWordCodePoint(U'a'));
  EXPECT_TRUE(IsWordCodePoint(U'_'));
  EXPECT_TRUE(IsWordCodePoint(U'9'));
  EXPECT_TRUE(IsWordCodePoint(0x00F1));   // n with tilde
  EXPECT_TRUE(IsWordCodePoint(0x0436));   // Cyrillic zhe
  EXPECT_TRUE(IsWordCodePoint(0x50BB));   // CJK ideograph
  EXPECT_FALSE(IsWordCodePoint(U'\''));
  EXPECT_FALSE(IsWordCodePoint(U' '));
  EXPECT_FALSE(IsWordCodePoint(0x00A0));  // no-break space
  EXPECT_FALSE(IsWordCodePoint(0x00BF));  // inverted question mark
  EXPECT_FALSE(IsWordCodePoint(0x2014));  // em dash
  EXPECT_FALSE(IsWordCodePoint(0x3002));  // ideographic full stop
  EXPECT_FALSE(IsWordCodePoint(0xFFFD));
  EXPECT_FALSE(IsWordCodePoint(0x1F92C));
}

TEST(ProfanityDetectorTest, MuteKeepsLowConfidenceWords) {
  TranscriptionResult transcript;
  transcript.segments.push_back(WordSegment(0, {{"shit", 1.0, 1.2, 0.3}}, "shit"));

  EXPECT_EQ(MakeDetector({"shit"}, CensorMode::kMute).Detect(transcript).size(), 1u);
}

TEST(ProfanityDetectorTest, BleepDropsLowConfidenceWords) {
  TranscriptionResult transcript;
  transcript.segments.push_back(
      WordSegment(0, {{"shit", 1.0, 1.2, 0.3}, {"crap", 1.2, 1.4, 0.6}}, "shit crap"));

  auto hits = MakeDetector({"shit", "crap"}, CensorMode::kBleep).Detect(transcript);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].word, "crap");
}

TEST(ProfanityDetectorTest, HitsAreSortedByStartThenEnd) {
  TranscriptionResult transcript;
  transcript.segments.push_back(WordSegment(1, {{"crap", 5.0, 5.4, 0.9}}, "crap"));
  transcript.segments.push_back(
      WordSegment(0, {{"damn", 1.0, 1.5, 0.9}, {"shit", 1.0, 1.2, 0.9}}, "damn shit"));

  auto hits = MakeDetector({"damn", "shit", "crap"}).Detect(transcript);
  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].word, "shit");
  EXPECT_EQ(hits[1].word, "damn");
  EXPECT_EQ(hits[2].word, "crap");
}

// =============================================================================
// Segment-text fallback
// =============================================================================

TEST(ProfanityDetectorTest, SegmentWithoutWordsUsesSegmentTiming) {
  TranscriptSegment seg;
  seg.id = 7;
  seg.start = 10.0;
  seg.end = 12.5;
  seg.text = "Well DAMN, damn it";
  seg.avg_confidence = 0.7;
  TranscriptionResult transcript;
  transcript.segments.push_back(seg);

  auto hits = MakeDetector({"damn"}).Detect(transcript);
  ASSERT_EQ(hits.size(), 2u);
  for (const auto& hit : hits) {
    EXPECT_EQ(hit.word, "damn");
    EXPECT_DOUBLE_EQ(hit.start, 10.0);
    EXPECT_DOUBLE_EQ(hit.end, 12.5);
    EXPECT_DOUBLE_EQ(hit.confidence, 0.7);
    EXPECT_EQ(hit.segment_id, 7);
  }
}

TEST(ProfanityDetectorTest, SegmentFallbackGatesOnAverageConfidenceInAnyMode) {
  TranscriptSegment seg;
  seg.start = 0.0;
  seg.end = 1.0;
  seg.text = "damn";
  seg.avg_confidence = 0.2;
  TranscriptionResult transcript;
  transcript.segments.push_back(seg);

  EXPECT_TRUE(MakeDetector({"damn"}, CensorMode::kMute).Detect(transcript).empty());
  EXPECT_TRUE(MakeDetector({"damn"}, CensorMode::kBleep).Detect(transcript).empty());
}

TEST(ProfanityDetectorTest, SegmentFallbackDoesNotMatchInsideWords) {
  TranscriptSegment seg;
  seg.text = "a passing class";
  TranscriptionResult transcript;
  transcript.segments.push_back(seg);

  EXPECT_TRUE(MakeDetector({"ass"}).Detect(transcript).empty());
}

TEST(ProfanityDetectorTest, EmptyTermListIsInvalidInput) {
  ProfanityDetector detector({}, DetectorConfig{});
  EXPECT_THROW(detector.Detect(TranscriptionResult{}), InvalidInputError);
}

// =============================================================================
// Terms
// =============================================================================

TEST(ProfanityTermTest, MatchesLiterallyAndCaseInsensitively) {
  EXPECT_EQ(EscapeRegex("a.b*c"), "a\\.b\\*c");
  ProfanityTerm term("f.ck");
  EXPECT_TRUE(term.FindIn("fuck").empty());
  ASSERT_EQ(term.FindIn("oh F.CK").size(), 1u);
  EXPECT_EQ(term.FindIn("oh F.CK")[0], MatchRange(3, 7));
}

TEST(ProfanityTermTest, NonAsciiLettersAreWordCharacters) {
  ProfanityTerm term("puta");
  // "putaña" and "éputa" continue the word; punctuation ends it.
  EXPECT_TRUE(term.FindIn("puta" "\xC3\xB1" "a").empty());
  EXPECT_TRUE(term.FindIn("\xC3\xA9" "puta").empty());
  EXPECT_EQ(term.FindIn("\xC2\xA1" "Puta" "\xE2\x80\xA6" " puta!").size(), 2u);
}

TEST(ProfanityDetectorTest, SegmentFallbackHonorsUnicodeBoundaries) {
  TranscriptSegment seg;
  seg.start = 1.0;
  seg.end = 2.0;
  seg.avg_confidence = 0.9;
  seg.text = "\xE2\x80\x9C" "Shit" "\xE2\x80\x9D" " and shit" "\xC3\xA9";
  TranscriptionResult transcript;
  transcript.segments.push_back(seg);

  auto hits = MakeDetector({"shit"}).Detect(transcript);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_DOUBLE_EQ(hits[0].start, 1.0);
  EXPECT_DOUBLE_EQ(hits[0].end, 2.0);
}

TEST(ProfanityTermTest, EmptyTermIsRejected) {
  EXPECT_THROW(ProfanityTerm("   "), InvalidInputError);
}

TEST(ProfanityTermTest, ParseCensorMode) {
  EXPECT_EQ(ParseCensorMode(" Bleep "), CensorMode::kBleep);
  EXPECT_EQ(ParseCensorMode("mute"), CensorMode::kMute);
  EXPECT_THROW(ParseCensorMode("silence"), ConfigError);
}

TEST(TermListTest, ParsesJsonArray) {
  auto words = ParseTermList(R"(["Fuck", " shit ", ""])");
  ASSERT_EQ(words.size(), 2u);
  EXPECT_EQ(words[0], "fuck");
  EXPECT_EQ(words[1], "shit");
}

TEST(TermListTest, ParsesTextLinesSkippingComments) {
  auto words = ParseTermList("# header\n\nDamn\n  crap  \n# trailing\n");
  ASSERT_EQ(words.size(), 2u);
  EXPECT_EQ(words[0], "damn");
  EXPECT_EQ(words[1], "crap");
}

TEST(TermListTest, RejectsBadShapesAndEmptyLists) {
  EXPECT_THROW(ParseTermList(R"({"words": ["a"]})"), ConfigError);
  EXPECT_THROW(ParseTermList(R"(["a", 3])"), ConfigError);
  EXPECT_THROW(ParseTermList("# only comments\n\n"), ConfigError);
  EXPECT_THROW(LoadTermListFile("/nonexistent/hush_terms.txt"), ConfigError);
}

TEST(TermListTest, LoadsFileAndDeduplicates) {
  const auto path = std::filesystem::temp_directory_path() / "hush_terms.txt";
  { std::ofstream(path) << "damn\nDAMN\ncrap\n"; }
  auto terms = BuildTerms(LoadTermListFile(path.string()));
  ASSERT_EQ(terms.size(), 2u);
  EXPECT_EQ(terms[0].Text(), "damn");
  EXPECT_EQ(terms[1].Text(), "crap");
  std::filesystem::remove(path);
}

TEST(TermListTest, DefaultListIsNotEmpty) {
  EXPECT_FALSE(DefaultProfanityWords().empty());
  EXPECT_EQ(BuildTerms(DefaultProfanityWords()).size(), DefaultProfanityWords().size());
}

}  // namespace
}  // namespace hush::detect::testing
