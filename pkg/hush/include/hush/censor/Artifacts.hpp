// Repository: Hush
// Component: Censor Artifacts
// Purpose: censor_log.json, censored_subtitles.srt and transcript_clean.txt.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_CENSOR_ARTIFACTS_HPP_
#define HUSH_CENSOR_ARTIFACTS_HPP_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hush/detect/ProfanityTypes.hpp"
#include "hush/transcript/TranscriptTypes.hpp"

namespace hush::censor {

constexpr const char* kMaskToken = "****";

// One {word, start, end, confidence, context} object per span, taken from
// the span's highest-confidence hit.
nlohmann::json BuildCensorLog(const std::vector<detect::ProfanitySpan>& spans);

// HH:MM:SS,mmm. Negative times clamp to zero; rounding to whole
// milliseconds happens before the fields are split.
std::string FormatSrtTimestamp(double seconds);

// Replaces every word-boundary, case-insensitive occurrence of each hit word.
std::string MaskContext(const std::string& context, const std::vector<detect::ProfanityHit>& hits);

// One cue per span with non-empty context; cue numbers stay contiguous.
std::string BuildSubtitles(const std::vector<detect::ProfanitySpan>& spans);

// One line per segment; words touching a span are masked.
std::string BuildCleanTranscript(const transcript::TranscriptionResult& transcript,
                                 const std::vector<detect::ProfanitySpan>& spans);

// Writes content to path, replacing it. Throws std::runtime_error.
void WriteTextFile(const std::string& path, const std::string& content);

}  // namespace hush::censor

#endif  // HUSH_CENSOR_ARTIFACTS_HPP_
