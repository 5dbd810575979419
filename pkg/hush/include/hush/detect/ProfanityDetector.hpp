// Repository: Hush
// Component: ProfanityDetector
// Purpose: Transcript words/segments -> profanity hits under a confidence
//          policy.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_DETECT_PROFANITY_DETECTOR_HPP_
#define HUSH_DETECT_PROFANITY_DETECTOR_HPP_

#include <vector>

#include "hush/detect/ProfanityTypes.hpp"
#include "hush/transcript/TranscriptTypes.hpp"

namespace hush::detect {

struct DetectorConfig {
  double min_confidence = 0.6;
  CensorMode mode = CensorMode::kMute;
};

// ProfanityDetector scans a transcript one segment at a time.
//
// Word path (segment has words): each word is normalized with
// NormalizeToken() and compared for equality with every term. A match below
// min_confidence is dropped in bleep mode and kept in mute mode, since mute
// intervals come from word timing, not from the recognizer's certainty.
//
// Segment path (segment has no words): each term's word-boundary pattern is
// searched in the segment text; every match is a hit spanning the whole
// segment at the segment's average confidence. Matches below min_confidence
// are always dropped here, in either mode.
//
// Output is sorted by (start, end).
class ProfanityDetector {
 public:
  ProfanityDetector(std::vector<ProfanityTerm> terms, DetectorConfig config);

  // Throws InvalidInputError when the term list is empty.
  std::vector<ProfanityHit> Detect(const transcript::TranscriptionResult& transcript) const;

  const std::vector<ProfanityTerm>& Terms() const { return terms_; }

 private:
  void DetectWords(const transcript::TranscriptSegment& segment, const std::string& context,
                   std::vector<ProfanityHit>& hits) const;
  void DetectSegmentText(const transcript::TranscriptSegment& segment,
                         const std::string& context, std::vector<ProfanityHit>& hits) const;

  std::vector<ProfanityTerm> terms_;
  DetectorConfig config_;
};

}  // namespace hush::detect

#endif  // HUSH_DETECT_PROFANITY_DETECTOR_HPP_
