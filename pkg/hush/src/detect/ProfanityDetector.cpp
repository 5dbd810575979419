// Repository: Hush
// Component: ProfanityDetector Implementation
// Copyright (c) 2026 RetroVue

#include "hush/detect/ProfanityDetector.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <tuple>

#include "hush/util/Errors.hpp"
#include "hush/util/Logger.hpp"
#include "hush/util/Strings.hpp"

namespace hush::detect {

using hush::util::Logger;

ProfanityDetector::ProfanityDetector(std::vector<ProfanityTerm> terms, DetectorConfig config)
    : terms_(std::move(terms)), config_(config) {}

std::vector<ProfanityHit> ProfanityDetector::Detect(
    const transcript::TranscriptionResult& transcript) const {
  if (terms_.empty()) {
    throw InvalidInputError("profanity detection called with an empty term list");
  }

  std::vector<ProfanityHit> hits;
  for (const auto& segment : transcript.segments) {
    const std::string context = util::Trim(segment.text);
    if (!segment.words.empty()) {
      DetectWords(segment, context, hits);
    } else {
      DetectSegmentText(segment, context, hits);
    }
  }

  std::stable_sort(hits.begin(), hits.end(), [](const ProfanityHit& a, const ProfanityHit& b) {
    return std::tie(a.start, a.end) < std::tie(b.start, b.end);
  });

  std::ostringstream oss;
  oss << "[Detector] hits=" << hits.size() << " segments=" << transcript.segments.size()
      << " mode=" << CensorModeName(config_.mode) << " min_confidence=" << config_.min_confidence;
  Logger::Info(oss.str());
  return hits;
}

void ProfanityDetector::DetectWords(const transcript::TranscriptSegment& segment,
                                    const std::string& context,
                                    std::vector<ProfanityHit>& hits) const {
  for (const auto& word : segment.words) {
    const std::string norm = NormalizeToken(word.text);
    if (norm.empty()) continue;

    const bool is_term = std::any_of(terms_.begin(), terms_.end(),
                                     [&](const ProfanityTerm& t) { return t.Text() == norm; });
    if (!is_term) continue;

    if (word.confidence < config_.min_confidence) {
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(3);
      if (config_.mode != CensorMode::kMute) {
        oss << "[Detector] skipping '" << norm << "' conf=" << word.confidence
            << " < min=" << config_.min_confidence << " mode=" << CensorModeName(config_.mode);
        Logger::Debug(oss.str());
        continue;
      }
      oss << "[Detector] keeping low-confidence '" << norm << "' conf=" << word.confidence
          << " < min=" << config_.min_confidence << " mode=mute";
      Logger::Debug(oss.str());
    }

    ProfanityHit hit;
    hit.word = norm;
    hit.start = word.start;
    hit.end = word.end;
    hit.confidence = word.confidence;
    hit.context = context;
    hit.segment_id = segment.id;
    hit.chunk_index = segment.chunk_index;
    hits.push_back(std::move(hit));
  }
}

void ProfanityDetector::DetectSegmentText(const transcript::TranscriptSegment& segment,
                                          const std::string& context,
                                          std::vector<ProfanityHit>& hits) const {
  for (const auto& term : terms_) {
    const std::size_t matches = term.FindIn(segment.text).size();
    if (matches == 0) continue;
    if (segment.avg_confidence < config_.min_confidence) {
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(3) << "[Detector] skipping segment-level match '"
          << term.Text() << "' seg_avg_conf=" << segment.avg_confidence
          << " < min=" << config_.min_confidence;
      Logger::Debug(oss.str());
      continue;
    }
    for (std::size_t i = 0; i < matches; ++i) {
      ProfanityHit hit;
      hit.word = term.Text();
      hit.start = segment.start;
      hit.end = segment.end;
      hit.confidence = segment.avg_confidence;
      hit.context = context;
      hit.segment_id = segment.id;
      hit.chunk_index = segment.chunk_index;
      hits.push_back(std::move(hit));
    }
  }
}

}  // namespace hush::detect
