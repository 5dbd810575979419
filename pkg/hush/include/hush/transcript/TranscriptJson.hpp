// Repository: Hush
// Component: TranscriptJson
// Purpose: transcript.json artifact.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_TRANSCRIPT_TRANSCRIPT_JSON_HPP_
#define HUSH_TRANSCRIPT_TRANSCRIPT_JSON_HPP_

#include <string>

#include <nlohmann/json.hpp>

#include "hush/transcript/TranscriptTypes.hpp"

namespace hush::transcript {

// {language, segments:[{id,start,end,text,words:[{word,start,end,confidence}],
//  avg_confidence,chunk_index}]}
nlohmann::json TranscriptToJson(const TranscriptionResult& result);

// Indent 2 plus a trailing newline. Invalid UTF-8 in strings is written as
// U+FFFD instead of failing the dump.
std::string DumpArtifactJson(const nlohmann::json& doc);

// Pretty-printed (indent 2). Throws std::runtime_error if the file cannot be
// written.
void SaveTranscriptJson(const TranscriptionResult& result, const std::string& path);

}  // namespace hush::transcript

#endif  // HUSH_TRANSCRIPT_TRANSCRIPT_JSON_HPP_
