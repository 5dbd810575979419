// Repository: Hush
// Component: Censor Artifacts Implementation
// Copyright (c) 2026 RetroVue

#include "hush/censor/Artifacts.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "hush/util/Strings.hpp"

namespace hush::censor {

using json = nlohmann::json;

json BuildCensorLog(const std::vector<detect::ProfanitySpan>& spans) {
  json entries = json::array();
  for (const auto& span : spans) {
    const detect::ProfanityHit* best = span.RepresentativeHit();
    entries.push_back({{"word", best ? best->word : std::string()},
                       {"start", span.start},
                       {"end", span.end},
                       {"confidence", best ? best->confidence : 0.0},
                       {"context", best ? best->context : std::string()}});
  }
  return entries;
}

std::string FormatSrtTimestamp(double seconds) {
  if (!(seconds > 0.0)) seconds = 0.0;
  const long long total_ms = std::llround(seconds * 1000.0);
  const long long hours = total_ms / 3600000;
  const long long minutes = (total_ms / 60000) % 60;
  const long long secs = (total_ms / 1000) % 60;
  const long long millis = total_ms % 1000;

  char buf[48];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld", hours, minutes, secs, millis);
  return buf;
}

std::string MaskContext(const std::string& context,
                        const std::vector<detect::ProfanityHit>& hits) {
  std::string masked = context;
  for (const auto& hit : hits) {
    if (util::Trim(hit.word).empty()) continue;
    const auto ranges = detect::ProfanityTerm(hit.word).FindIn(masked);
    for (auto it = ranges.rbegin(); it != ranges.rend(); ++it) {
      masked.replace(it->first, it->second - it->first, kMaskToken);
    }
  }
  return masked;
}

std::string BuildSubtitles(const std::vector<detect::ProfanitySpan>& spans) {
  std::ostringstream out;
  int cue = 1;
  for (const auto& span : spans) {
    const detect::ProfanityHit* best = span.RepresentativeHit();
    if (best == nullptr || best->context.empty()) continue;

    if (cue > 1) out << '\n';
    out << cue << '\n'
        << FormatSrtTimestamp(span.start) << " --> " << FormatSrtTimestamp(span.end) << '\n'
        << MaskContext(best->context, span.hits) << '\n';
    ++cue;
  }
  return out.str();
}

std::string BuildCleanTranscript(const transcript::TranscriptionResult& transcript,
                                 const std::vector<detect::ProfanitySpan>& spans) {
  auto in_span = [&spans](double t) {
    for (const auto& span : spans) {
      if (span.start <= t && t <= span.end) return true;
    }
    return false;
  };

  std::ostringstream out;
  bool first_line = true;
  for (const auto& segment : transcript.segments) {
    if (!first_line) out << '\n';
    first_line = false;

    if (segment.words.empty()) {
      out << segment.text;
      continue;
    }
    bool first_word = true;
    for (const auto& word : segment.words) {
      if (!first_word) out << ' ';
      first_word = false;
      out << ((in_span(word.start) || in_span(word.end)) ? std::string(kMaskToken) : word.text);
    }
  }
  return out.str();
}

void WriteTextFile(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out) {
    throw std::runtime_error("cannot write " + path);
  }
  out << content;
  if (!out) {
    throw std::runtime_error("write failed: " + path);
  }
}

}  // namespace hush::censor
