// Repository: Hush
// Component: RemoteApiBackend Implementation
// Purpose: libcurl multipart upload and verbose_json parsing.
// Copyright (c) 2026 RetroVue

#include "hush/transcript/RemoteApiBackend.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "hush/audio/WavFile.hpp"
#include "hush/util/Errors.hpp"
#include "hush/util/Logger.hpp"

namespace hush::transcript {

using hush::util::Logger;
using json = nlohmann::json;

namespace {

size_t AppendBody(void* contents, size_t size, size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  body->append(static_cast<const char*>(contents), size * nmemb);
  return size * nmemb;
}

struct CurlDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct MimeDeleter {
  void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};
struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

void AddTextPart(curl_mime* mime, const char* name, const std::string& value) {
  curl_mimepart* part = curl_mime_addpart(mime);
  curl_mime_name(part, name);
  curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

// Numbers may arrive as strings from some compatible servers.
std::optional<double> NumberField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return std::nullopt;
  if (it->is_number()) return it->get<double>();
  if (it->is_string()) {
    const std::string s = it->get<std::string>();
    try {
      size_t pos = 0;
      const double v = std::stod(s, &pos);
      if (pos == s.size()) return v;
    } catch (const std::exception&) {
      Logger::Debug("[RemoteApiBackend] non-numeric '" + std::string(key) + "': " + s);
    }
  }
  return std::nullopt;
}

std::string StringField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return "";
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

RawWord ParseWord(const json& w) {
  RawWord word;
  word.word = StringField(w, "word");
  word.start = NumberField(w, "start");
  word.end = NumberField(w, "end");
  word.confidence = NumberField(w, "confidence");
  return word;
}

size_t SegmentForTime(const std::vector<RawSegment>& segments, double t) {
  size_t nearest = 0;
  double best = std::numeric_limits<double>::infinity();
  for (size_t i = 0; i < segments.size(); ++i) {
    const double start = segments[i].start;
    const double end = segments[i].end.value_or(start);
    if (t >= start && t <= end) return i;
    const double distance = std::fabs(t - start);
    if (distance < best) {
      best = distance;
      nearest = i;
    }
  }
  return nearest;
}

}  // namespace

RawTranscript ParseVerboseJson(const std::string& body) {
  json doc;
  try {
    doc = json::parse(body);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("RemoteApiBackend: invalid JSON response: ") + e.what());
  }
  if (!doc.is_object()) {
    throw std::runtime_error("RemoteApiBackend: response is not a JSON object");
  }

  RawTranscript out;
  out.payload = body;
  const std::string language = StringField(doc, "language");
  out.language = language.empty() ? kUnknownLanguage : language;

  auto segs = doc.find("segments");
  if (segs != doc.end() && segs->is_array()) {
    for (const auto& s : *segs) {
      if (!s.is_object()) continue;
      RawSegment seg;
      if (auto id = NumberField(s, "id")) seg.id = static_cast<int>(*id);
      seg.start = NumberField(s, "start").value_or(0.0);
      seg.end = NumberField(s, "end");
      seg.text = StringField(s, "text");
      seg.confidence = NumberField(s, "confidence");
      auto words = s.find("words");
      if (words != s.end() && words->is_array()) {
        for (const auto& w : *words) {
          if (w.is_object()) seg.words.push_back(ParseWord(w));
        }
      }
      out.segments.push_back(std::move(seg));
    }
  }

  auto top_words = doc.find("words");
  if (top_words != doc.end() && top_words->is_array() && !top_words->empty()) {
    if (out.segments.empty()) {
      // Word-only response: one segment spanning the whole text.
      RawSegment seg;
      seg.text = StringField(doc, "text");
      out.segments.push_back(std::move(seg));
    }
    for (const auto& w : *top_words) {
      if (!w.is_object()) continue;
      RawWord word = ParseWord(w);
      const size_t index = SegmentForTime(out.segments, word.start.value_or(0.0));
      out.segments[index].words.push_back(std::move(word));
    }
    // A synthesized segment takes its bounds from its words.
    RawSegment& first = out.segments.front();
    if (!first.end.has_value() && !first.words.empty()) {
      first.start = first.words.front().start.value_or(0.0);
      first.end = first.words.back().end.value_or(first.words.back().start.value_or(first.start));
    }
  }
  return out;
}

RemoteApiBackend::RemoteApiBackend(RemoteApiConfig config) : config_(std::move(config)) {
  if (config_.api_key.empty()) {
    throw ConfigError("OPENAI_API_KEY is required for the openai_api backend");
  }
  while (!config_.base_url.empty() && config_.base_url.back() == '/') {
    config_.base_url.pop_back();
  }
}

std::string RemoteApiBackend::EndpointUrl() const {
  return config_.base_url + "/audio/transcriptions";
}

RawTranscript RemoteApiBackend::Transcribe(const audio::AudioChunk& chunk,
                                           const std::string& language,
                                           const std::string& model) {
  const std::vector<uint8_t> wav = audio::EncodeWav(chunk);

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("RemoteApiBackend: curl_easy_init failed");
  }

  std::unique_ptr<curl_mime, MimeDeleter> mime(curl_mime_init(curl.get()));
  curl_mimepart* file_part = curl_mime_addpart(mime.get());
  curl_mime_name(file_part, "file");
  curl_mime_filename(file_part, ("chunk_" + std::to_string(chunk.index) + ".wav").c_str());
  curl_mime_type(file_part, "audio/wav");
  curl_mime_data(file_part, reinterpret_cast<const char*>(wav.data()), wav.size());

  AddTextPart(mime.get(), "model", model);
  AddTextPart(mime.get(), "response_format", "verbose_json");
  AddTextPart(mime.get(), "temperature", "0");
  if (!language.empty()) {
    AddTextPart(mime.get(), "language", language);
  }
  AddTextPart(mime.get(), "timestamp_granularities[]", "segment");
  AddTextPart(mime.get(), "timestamp_granularities[]", "word");

  const std::string auth = "Authorization: Bearer " + config_.api_key;
  std::unique_ptr<curl_slist, SlistDeleter> headers(curl_slist_append(nullptr, auth.c_str()));

  const std::string url = EndpointUrl();
  std::string body;
  char error_buffer[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.timeout_seconds);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "hush/1.0");

  {
    std::ostringstream oss;
    oss << "[RemoteApiBackend] POST " << url << " chunk=" << chunk.index << " model=" << model
        << " bytes=" << wav.size();
    Logger::Debug(oss.str());
  }

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    std::ostringstream oss;
    oss << "RemoteApiBackend: request failed: "
        << (error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res));
    throw std::runtime_error(oss.str());
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status >= 400) {
    std::ostringstream oss;
    oss << "RemoteApiBackend: HTTP " << status << ": " << body.substr(0, 512);
    throw std::runtime_error(oss.str());
  }

  return ParseVerboseJson(body);
}

}  // namespace hush::transcript
