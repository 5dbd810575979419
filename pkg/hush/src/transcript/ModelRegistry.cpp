// Repository: Hush
// Component: ModelRegistry Implementation
// Copyright (c) 2026 RetroVue

#include "hush/transcript/ModelRegistry.hpp"

#include <sstream>
#include <stdexcept>

#include "hush/util/Logger.hpp"
#include "hush/util/Strings.hpp"

namespace hush::transcript {

using hush::util::Logger;

ModelRegistry::ModelRegistry(LoaderFn loader) : loader_(std::move(loader)) {
  if (!loader_) {
    throw std::invalid_argument("ModelRegistry requires a loader");
  }
}

std::string ModelRegistry::Key(const std::string& model_name) {
  std::string key = util::Trim(model_name);
  return key.empty() ? std::string(kDefaultLocalModel) : key;
}

std::shared_ptr<ILocalModel> ModelRegistry::Acquire(const std::string& model_name) {
  const std::string key = Key(model_name);
  std::lock_guard<std::mutex> lock(init_mutex_);
  auto it = models_.find(key);
  if (it != models_.end()) {
    return it->second;
  }

  {
    std::ostringstream oss;
    oss << "[ModelRegistry] loading model=" << key;
    Logger::Info(oss.str());
  }
  std::shared_ptr<ILocalModel> model = loader_(key);
  if (!model) {
    throw std::runtime_error("ModelRegistry: loader returned no model for " + key);
  }
  models_.emplace(key, model);
  return model;
}

std::mutex& ModelRegistry::TranscribeMutex(const std::string& model_name) {
  const std::string key = Key(model_name);
  std::lock_guard<std::mutex> lock(init_mutex_);
  auto& slot = transcribe_mutexes_[key];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

bool ModelRegistry::IsLoaded(const std::string& model_name) const {
  const std::string key = Key(model_name);
  std::lock_guard<std::mutex> lock(init_mutex_);
  return models_.count(key) != 0;
}

size_t ModelRegistry::LoadedCount() const {
  std::lock_guard<std::mutex> lock(init_mutex_);
  return models_.size();
}

}  // namespace hush::transcript
