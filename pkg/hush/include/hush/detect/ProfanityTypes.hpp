// Repository: Hush
// Component: Profanity Types
// Purpose: Terms, hits and merged censorship spans.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_DETECT_PROFANITY_TYPES_HPP_
#define HUSH_DETECT_PROFANITY_TYPES_HPP_

#include <cstddef>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace hush::detect {

enum class CensorMode { kMute, kBleep };

const char* CensorModeName(CensorMode mode);

// Accepts "mute" / "bleep" (case-insensitive, trimmed). Throws ConfigError.
CensorMode ParseCensorMode(const std::string& value);

// Byte range [first, second) within a UTF-8 string.
using MatchRange = std::pair<std::size_t, std::size_t>;

// Canonical lowercase term plus its case-insensitive word-boundary pattern.
class ProfanityTerm {
 public:
  // Trims and lowercases text. Throws InvalidInputError for an empty term.
  explicit ProfanityTerm(const std::string& text);

  const std::string& Text() const { return text_; }

  // Case-insensitive occurrences in text whose edges fall on word
  // boundaries, as decided by IsWordCodePoint().
  std::vector<MatchRange> FindIn(const std::string& text) const;

 private:
  std::string text_;
  std::regex pattern_;
};

struct ProfanityHit {
  std::string word;
  double start = 0.0;
  double end = 0.0;
  double confidence = 0.0;
  std::string context;
  int segment_id = 0;
  int chunk_index = 0;
};

// start = min(hit.start), end = max(hit.end) over hits.
struct ProfanitySpan {
  double start = 0.0;
  double end = 0.0;
  std::vector<ProfanityHit> hits;
  double max_confidence = 0.0;

  // Highest-confidence hit; the first one on ties. nullptr when empty.
  const ProfanityHit* RepresentativeHit() const;
  // Word of RepresentativeHit(), or "" when there are no hits.
  std::string RepresentativeWord() const;
};

// Letters, digits, marks and '_'. Punctuation (ASCII, Latin-1, the
// General and CJK punctuation blocks, fullwidth forms), symbols, spaces and
// undecodable bytes are not word code points.
bool IsWordCodePoint(char32_t cp);

// Every code point that is neither a word code point nor '\'' is dropped,
// then ASCII letters are lowercased. Malformed UTF-8 bytes are dropped.
std::string NormalizeToken(const std::string& word);

// Escapes regex metacharacters so text matches literally.
std::string EscapeRegex(const std::string& text);

}  // namespace hush::detect

#endif  // HUSH_DETECT_PROFANITY_TYPES_HPP_
