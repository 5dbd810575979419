// Repository: Hush
// Component: SpanMerger Implementation
// Copyright (c) 2026 RetroVue

#include "hush/detect/SpanMerger.hpp"

#include <algorithm>
#include <sstream>

#include "hush/util/Logger.hpp"

namespace hush::detect {

std::vector<ProfanitySpan> MergeHits(const std::vector<ProfanityHit>& hits, int max_gap_ms) {
  std::vector<ProfanitySpan> spans;
  if (hits.empty()) return spans;

  const double max_gap_s = static_cast<double>(max_gap_ms) / 1000.0;

  ProfanitySpan current;
  current.start = hits.front().start;
  current.end = hits.front().end;
  current.hits.push_back(hits.front());

  auto flush = [&spans](ProfanitySpan& span) {
    span.max_confidence = 0.0;
    for (const auto& h : span.hits) {
      span.max_confidence = std::max(span.max_confidence, h.confidence);
    }
    spans.push_back(std::move(span));
  };

  for (size_t i = 1; i < hits.size(); ++i) {
    const ProfanityHit& hit = hits[i];
    const double gap = hit.start - current.end;
    if (gap <= max_gap_s) {
      current.end = std::max(current.end, hit.end);
      current.hits.push_back(hit);
    } else {
      flush(current);
      current = ProfanitySpan{};
      current.start = hit.start;
      current.end = hit.end;
      current.hits.push_back(hit);
    }
  }
  flush(current);

  std::ostringstream oss;
  oss << "[SpanMerger] hits=" << hits.size() << " spans=" << spans.size()
      << " max_gap_ms=" << max_gap_ms;
  util::Logger::Info(oss.str());
  return spans;
}

}  // namespace hush::detect
