// Repository: Hush
// Component: Transcript Types
// Purpose: Backend-normalized responses and the aggregated, time-ordered
//          transcript built from them.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_TRANSCRIPT_TRANSCRIPT_TYPES_HPP_
#define HUSH_TRANSCRIPT_TRANSCRIPT_TYPES_HPP_

#include <optional>
#include <string>
#include <vector>

namespace hush::transcript {

constexpr const char* kUnknownLanguage = "unknown";

// =============================================================================
// Backend response shape (times relative to the chunk start)
// =============================================================================

struct RawWord {
  std::string word;
  std::optional<double> start;  // Segment start when absent
  std::optional<double> end;
  std::optional<double> confidence;  // 1.0 when the backend exposes none
};

struct RawSegment {
  std::optional<int> id;
  double start = 0.0;
  std::optional<double> end;
  std::string text;
  std::optional<double> confidence;
  std::vector<RawWord> words;
};

struct RawTranscript {
  std::string language = kUnknownLanguage;
  std::vector<RawSegment> segments;
  std::string payload;  // Backend's own response text, kept for debugging
};

// =============================================================================
// Aggregated transcript (absolute times)
// =============================================================================

struct TranscriptWord {
  std::string text;
  double start = 0.0;
  double end = 0.0;
  double confidence = 1.0;
};

struct TranscriptSegment {
  int id = 0;
  double start = 0.0;
  double end = 0.0;
  std::string text;
  std::vector<TranscriptWord> words;  // Time-ordered, possibly empty
  double avg_confidence = 1.0;
  int chunk_index = 0;
};

// Sorted by (start, chunk_index, id). Read-only once built.
struct TranscriptionResult {
  std::vector<TranscriptSegment> segments;
  std::string language = kUnknownLanguage;
  std::vector<std::string> raw_payloads;
};

}  // namespace hush::transcript

#endif  // HUSH_TRANSCRIPT_TRANSCRIPT_TYPES_HPP_
