// Repository: Hush
// Component: ModelRegistry
// Purpose: Lazily loaded, shared local models plus one inference mutex per
//          model name.
// Copyright (c) 2026 RetroVue

#ifndef HUSH_TRANSCRIPT_MODEL_REGISTRY_HPP_
#define HUSH_TRANSCRIPT_MODEL_REGISTRY_HPP_

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "hush/audio/AudioTypes.hpp"
#include "hush/transcript/TranscriptTypes.hpp"

namespace hush::transcript {

// A loaded local inference model. Not assumed safe for concurrent calls.
class ILocalModel {
 public:
  virtual ~ILocalModel() = default;
  virtual RawTranscript Transcribe(const audio::AudioChunk& chunk,
                                   const std::string& language) = 0;
};

// Model used when a caller passes an empty model name.
constexpr const char* kDefaultLocalModel = "base";

// ModelRegistry owns every loaded local model, keyed by model name, and the
// per-model mutex that serializes inference on it.
//
// Thread Safety:
// - Acquire() and TranscribeMutex() are safe from any thread. Both maps are
//   guarded by one coarse init mutex; a model is loaded while holding it, so
//   two workers asking for the same cold model never load it twice.
// - The per-model mutex is the only long-held lock. Callers hold it for
//   exactly one ILocalModel::Transcribe() call.
//
// Pass the registry explicitly to whatever needs it; there is no global.
class ModelRegistry {
 public:
  using LoaderFn = std::function<std::shared_ptr<ILocalModel>(const std::string& model_name)>;

  explicit ModelRegistry(LoaderFn loader);

  ModelRegistry(const ModelRegistry&) = delete;
  ModelRegistry& operator=(const ModelRegistry&) = delete;

  // Returns the cached model, loading it on first use.
  // Loader exceptions propagate; nothing is cached for a failed load.
  std::shared_ptr<ILocalModel> Acquire(const std::string& model_name);

  // Mutex guarding inference for model_name. Created on first request and
  // stable for the registry's lifetime.
  std::mutex& TranscribeMutex(const std::string& model_name);

  bool IsLoaded(const std::string& model_name) const;
  size_t LoadedCount() const;

 private:
  static std::string Key(const std::string& model_name);

  LoaderFn loader_;
  mutable std::mutex init_mutex_;
  std::map<std::string, std::shared_ptr<ILocalModel>> models_;
  std::map<std::string, std::unique_ptr<std::mutex>> transcribe_mutexes_;
};

}  // namespace hush::transcript

#endif  // HUSH_TRANSCRIPT_MODEL_REGISTRY_HPP_
