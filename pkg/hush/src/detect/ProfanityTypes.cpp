// Repository: Hush
// Component: Profanity Types Implementation
// Copyright (c) 2026 RetroVue

#include "hush/detect/ProfanityTypes.hpp"

#include <cctype>
#include <cstddef>

#include "hush/util/Errors.hpp"
#include "hush/util/Strings.hpp"

namespace hush::detect {

namespace {

constexpr char32_t kInvalidCodePoint = 0xFFFD;

// Decodes the code point starting at text[pos]. Malformed or truncated
// sequences decode as U+FFFD with a length of one byte.
char32_t DecodeAt(const std::string& text, std::size_t pos, std::size_t* length) {
  const unsigned char lead = static_cast<unsigned char>(text[pos]);
  *length = 1;
  if (lead < 0x80) return lead;

  std::size_t extra = 0;
  char32_t cp = 0;
  if ((lead & 0xE0) == 0xC0) {
    extra = 1;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    extra = 2;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    extra = 3;
    cp = lead & 0x07;
  } else {
    return kInvalidCodePoint;
  }
  if (pos + extra >= text.size()) return kInvalidCodePoint;
  for (std::size_t i = 1; i <= extra; ++i) {
    const unsigned char c = static_cast<unsigned char>(text[pos + i]);
    if ((c & 0xC0) != 0x80) return kInvalidCodePoint;
    cp = (cp << 6) | (c & 0x3F);
  }
  *length = extra + 1;
  return cp;
}

// Code point ending just before text[pos] (pos > 0).
char32_t DecodeBefore(const std::string& text, std::size_t pos) {
  std::size_t start = pos - 1;
  while (start > 0 && pos - start < 4 &&
         (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
    --start;
  }
  std::size_t length = 0;
  const char32_t cp = DecodeAt(text, start, &length);
  return start + length == pos ? cp : kInvalidCodePoint;
}

bool InRange(char32_t cp, char32_t lo, char32_t hi) { return cp >= lo && cp <= hi; }

}  // namespace

bool IsWordCodePoint(char32_t cp) {
  if (cp < 0x80) {
    return std::isalnum(static_cast<int>(cp)) || cp == '_';
  }
  if (InRange(cp, 0x80, 0xBF)) {
    // Latin-1 punctuation and symbols; keep the ordinal, superscript,
    // micro and fraction characters.
    return cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 ||
           cp == 0xBA || InRange(cp, 0xBC, 0xBE);
  }
  if (cp == 0xD7 || cp == 0xF7) return false;
  if (InRange(cp, 0x2000, 0x206F)) return false;  // general punctuation, spaces
  if (InRange(cp, 0x20A0, 0x20CF)) return false;  // currency
  if (InRange(cp, 0x2190, 0x245F)) return false;  // arrows, math, technical
  if (InRange(cp, 0x2500, 0x2BFF)) return false;  // box drawing, shapes, dingbats
  if (InRange(cp, 0x2E00, 0x2E7F)) return false;  // supplemental punctuation
  if (InRange(cp, 0x3000, 0x3004) || InRange(cp, 0x3008, 0x3020) ||
      InRange(cp, 0x303D, 0x303F)) {
    return false;  // CJK punctuation
  }
  if (InRange(cp, 0xD800, 0xF8FF)) return false;  // surrogates, private use
  if (InRange(cp, 0xFE10, 0xFE1F) || InRange(cp, 0xFE30, 0xFE6F)) return false;
  if (InRange(cp, 0xFF00, 0xFF0F) || InRange(cp, 0xFF1A, 0xFF20) ||
      InRange(cp, 0xFF3B, 0xFF40) || InRange(cp, 0xFF5B, 0xFF65)) {
    return false;  // fullwidth punctuation
  }
  if (InRange(cp, 0xFFF0, 0xFFFF)) return false;     // specials, U+FFFD
  if (InRange(cp, 0x1F000, 0x1FAFF)) return false;   // emoji and pictographs
  return cp <= 0x10FFFF;
}

const char* CensorModeName(CensorMode mode) {
  switch (mode) {
    case CensorMode::kMute:
      return "mute";
    case CensorMode::kBleep:
      return "bleep";
  }
  return "unknown";
}

CensorMode ParseCensorMode(const std::string& value) {
  const std::string v = util::ToLower(util::Trim(value));
  if (v == "mute") return CensorMode::kMute;
  if (v == "bleep") return CensorMode::kBleep;
  throw ConfigError("invalid mode '" + value + "', expected 'mute' or 'bleep'");
}

std::string EscapeRegex(const std::string& text) {
  static const std::string kSpecial = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(text.size() * 2);
  for (char c : text) {
    if (kSpecial.find(c) != std::string::npos) out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

ProfanityTerm::ProfanityTerm(const std::string& text)
    : text_(util::ToLower(util::Trim(text))) {
  if (text_.empty()) {
    throw InvalidInputError("profanity term is empty");
  }
  pattern_ = std::regex(EscapeRegex(text_), std::regex::ECMAScript | std::regex::icase);
}

std::vector<MatchRange> ProfanityTerm::FindIn(const std::string& text) const {
  auto is_word_before = [&text](std::size_t pos) {
    return pos > 0 && IsWordCodePoint(DecodeBefore(text, pos));
  };
  auto is_word_at = [&text](std::size_t pos) {
    std::size_t length = 0;
    return pos < text.size() && IsWordCodePoint(DecodeAt(text, pos, &length));
  };

  std::vector<MatchRange> ranges;
  const auto end = std::sregex_iterator();
  for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern_); it != end; ++it) {
    const std::size_t first = static_cast<std::size_t>(it->position(0));
    const std::size_t last = first + static_cast<std::size_t>(it->length(0));
    if (first == last) continue;
    const bool starts_at_boundary = is_word_before(first) != is_word_at(first);
    const bool ends_at_boundary = is_word_before(last) != is_word_at(last);
    if (starts_at_boundary && ends_at_boundary) {
      ranges.emplace_back(first, last);
    }
  }
  return ranges;
}

const ProfanityHit* ProfanitySpan::RepresentativeHit() const {
  const ProfanityHit* best = nullptr;
  for (const auto& hit : hits) {
    if (best == nullptr || hit.confidence > best->confidence) {
      best = &hit;
    }
  }
  return best;
}

std::string ProfanitySpan::RepresentativeWord() const {
  const ProfanityHit* best = RepresentativeHit();
  return best != nullptr ? best->word : std::string();
}

std::string NormalizeToken(const std::string& word) {
  std::string out;
  out.reserve(word.size());
  std::size_t pos = 0;
  while (pos < word.size()) {
    std::size_t length = 0;
    const char32_t cp = DecodeAt(word, pos, &length);
    if (cp == '\'' || IsWordCodePoint(cp)) {
      if (cp < 0x80) {
        out.push_back(static_cast<char>(std::tolower(static_cast<int>(cp))));
      } else {
        out.append(word, pos, length);
      }
    }
    pos += length;
  }
  return out;
}

}  // namespace hush::detect
