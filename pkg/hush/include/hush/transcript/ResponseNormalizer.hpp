// Repository: Hush
// Component: ResponseNormalizer
// Purpose: Backend response (chunk-relative) -> absolute TranscriptSegments.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_TRANSCRIPT_RESPONSE_NORMALIZER_HPP_
#define HUSH_TRANSCRIPT_RESPONSE_NORMALIZER_HPP_

#include <vector>

#include "hush/transcript/TranscriptTypes.hpp"

namespace hush::transcript {

// Defaults applied per segment:
//   id -> position in the response, end -> start, avg_confidence -> mean of
//   word confidences, else segment confidence, else 1.0.
// Per word: text trimmed (empty words skipped), start -> segment start,
//   end -> word start, confidence -> 1.0.
// chunk_start_time is added to every timestamp.
std::vector<TranscriptSegment> NormalizeResponse(const RawTranscript& raw,
                                                 int chunk_index,
                                                 double chunk_start_time);

}  // namespace hush::transcript

#endif  // HUSH_TRANSCRIPT_RESPONSE_NORMALIZER_HPP_
