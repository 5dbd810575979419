// Repository: Hush
// Component: SpanMerger
// Purpose: Gap-based clustering of hits into censorship spans.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_DETECT_SPAN_MERGER_HPP_
#define HUSH_DETECT_SPAN_MERGER_HPP_

#include <vector>

#include "hush/detect/ProfanityTypes.hpp"

namespace hush::detect {

// Single left-to-right pass over hits sorted by (start, end). A hit whose
// start is at most max_gap_ms after the open span's end joins it; otherwise
// the open span is emitted and a new one starts. Hit order inside a span is
// preserved. Empty input -> empty output.
std::vector<ProfanitySpan> MergeHits(const std::vector<ProfanityHit>& hits, int max_gap_ms);

}  // namespace hush::detect

#endif  // HUSH_DETECT_SPAN_MERGER_HPP_
