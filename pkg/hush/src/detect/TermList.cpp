// Repository: Hush
// Component: TermList Implementation
// Copyright (c) 2026 RetroVue

#include "hush/detect/TermList.hpp"

#include <fstream>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

#include "hush/util/Errors.hpp"
#include "hush/util/Strings.hpp"

namespace hush::detect {

using json = nlohmann::json;

const std::vector<std::string>& DefaultProfanityWords() {
  static const std::vector<std::string> kWords = {
      "fuck", "shit", "bitch", "asshole", "bastard", "damn", "crap"};
  return kWords;
}

std::vector<std::string> ParseTermList(const std::string& content) {
  std::vector<std::string> words;

  const json doc = json::parse(content, nullptr, /*allow_exceptions=*/false);
  if (!doc.is_discarded()) {
    if (!doc.is_array()) {
      throw ConfigError("profanity list JSON must be a list of strings");
    }
    for (const auto& item : doc) {
      if (!item.is_string()) {
        throw ConfigError("profanity list JSON must be a list of strings");
      }
      std::string w = util::ToLower(util::Trim(item.get<std::string>()));
      if (!w.empty()) words.push_back(std::move(w));
    }
  } else {
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
      line = util::Trim(line);
      if (line.empty() || line[0] == '#') continue;
      words.push_back(util::ToLower(line));
    }
  }

  if (words.empty()) {
    throw ConfigError("profanity list is empty or has only comments/blank lines");
  }
  return words;
}

std::vector<std::string> LoadTermListFile(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    throw ConfigError("profanity list file not found: " + path);
  }
  std::ostringstream content;
  content << in.rdbuf();
  return ParseTermList(content.str());
}

std::vector<ProfanityTerm> BuildTerms(const std::vector<std::string>& words) {
  std::vector<ProfanityTerm> terms;
  std::set<std::string> seen;
  for (const auto& raw : words) {
    const std::string w = util::ToLower(util::Trim(raw));
    if (w.empty() || !seen.insert(w).second) continue;
    terms.emplace_back(w);
  }
  return terms;
}

}  // namespace hush::detect
