// Repository: Hush
// Component: TermList
// Purpose: Profanity term list loading (JSON array or plain text) and the
//          built-in English default.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_DETECT_TERM_LIST_HPP_
#define HUSH_DETECT_TERM_LIST_HPP_

#include <string>
#include <vector>

#include "hush/detect/ProfanityTypes.hpp"

namespace hush::detect {

const std::vector<std::string>& DefaultProfanityWords();

// Content that parses as JSON must be an array of strings. Anything else is
// read as text: one term per line, '#' comment lines and blank lines skipped.
// Throws ConfigError for a JSON value of the wrong shape or an empty result.
std::vector<std::string> ParseTermList(const std::string& content);

// Throws ConfigError when the file is missing or unreadable.
std::vector<std::string> LoadTermListFile(const std::string& path);

// Trimmed, lowercased, empty entries dropped, duplicates removed keeping the
// first occurrence.
std::vector<ProfanityTerm> BuildTerms(const std::vector<std::string>& words);

}  // namespace hush::detect

#endif  // HUSH_DETECT_TERM_LIST_HPP_
