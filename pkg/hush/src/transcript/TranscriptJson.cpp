// Repository: Hush
// Component: TranscriptJson Implementation
// Copyright (c) 2026 RetroVue

#include "hush/transcript/TranscriptJson.hpp"

#include <fstream>
#include <stdexcept>

namespace hush::transcript {

using json = nlohmann::json;

json TranscriptToJson(const TranscriptionResult& result) {
  json segments = json::array();
  for (const TranscriptSegment& seg : result.segments) {
    json words = json::array();
    for (const TranscriptWord& w : seg.words) {
      words.push_back({{"word", w.text},
                       {"start", w.start},
                       {"end", w.end},
                       {"confidence", w.confidence}});
    }
    segments.push_back({{"id", seg.id},
                        {"start", seg.start},
                        {"end", seg.end},
                        {"text", seg.text},
                        {"words", std::move(words)},
                        {"avg_confidence", seg.avg_confidence},
                        {"chunk_index", seg.chunk_index}});
  }
  return json{{"language", result.language}, {"segments", std::move(segments)}};
}

std::string DumpArtifactJson(const json& doc) {
  return doc.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

void SaveTranscriptJson(const TranscriptionResult& result, const std::string& path) {
  const std::string text = DumpArtifactJson(TranscriptToJson(result));
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot write transcript: " + path);
  }
  out << text;
  if (!out) {
    throw std::runtime_error("write failed: " + path);
  }
}

}  // namespace hush::transcript
