// Repository: Hush
// Component: ResponseNormalizer Implementation
// Copyright (c) 2026 RetroVue

#include "hush/transcript/ResponseNormalizer.hpp"

#include <string>

#include "hush/util/Strings.hpp"

namespace hush::transcript {

using hush::util::Trim;

std::vector<TranscriptSegment> NormalizeResponse(const RawTranscript& raw,
                                                 int chunk_index,
                                                 double chunk_start_time) {
  std::vector<TranscriptSegment> out;
  out.reserve(raw.segments.size());

  for (const RawSegment& seg : raw.segments) {
    const double seg_start_rel = seg.start;
    const double seg_end_rel = seg.end.value_or(seg_start_rel);

    TranscriptSegment segment;
    segment.id = seg.id.value_or(static_cast<int>(out.size()));
    segment.start = seg_start_rel + chunk_start_time;
    segment.end = seg_end_rel + chunk_start_time;
    segment.text = Trim(seg.text);
    segment.chunk_index = chunk_index;

    double confidence_sum = 0.0;
    for (const RawWord& w : seg.words) {
      std::string text = Trim(w.word);
      if (text.empty()) continue;

      const double w_start_rel = w.start.value_or(seg_start_rel);
      const double w_end_rel = w.end.value_or(w_start_rel);

      TranscriptWord word;
      word.text = std::move(text);
      word.start = w_start_rel + chunk_start_time;
      word.end = w_end_rel + chunk_start_time;
      word.confidence = w.confidence.value_or(1.0);
      confidence_sum += word.confidence;
      segment.words.push_back(std::move(word));
    }

    if (!segment.words.empty()) {
      segment.avg_confidence = confidence_sum / static_cast<double>(segment.words.size());
    } else {
      segment.avg_confidence = seg.confidence.value_or(1.0);
    }
    out.push_back(std::move(segment));
  }
  return out;
}

}  // namespace hush::transcript
