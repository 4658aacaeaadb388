#ifndef MODEL_MANAGER_HPP
#define MODEL_MANAGER_HPP

#include "core/config.hpp"
#include "models/base_model.hpp"

#include <memory>
#include <mutex>
#include <string>

// Loads the admission classifier once. A path ending in ".onnx" selects the
// onnxruntime backend, anything else the native feed-forward weight file.
// A failed load installs a seeded untrained network and marks the manager
// degraded; serving continues.
class ModelManager {
public:
  explicit ModelManager(const Config::ClassifierConfig &config);

  // Takes an already-built model, used by tests and embedding callers
  ModelManager(const Config::ClassifierConfig &config,
               std::shared_ptr<IAdmissionModel> injected_model);

  // Provides thread-safe access to the currently active model.
  // Null when the classifier is disabled.
  std::shared_ptr<IAdmissionModel> get_active_model() const;

  bool is_degraded() const;
  std::string model_kind() const;
  double decision_threshold() const { return config_.decision_threshold; }

private:
  void load_initial_model();

  Config::ClassifierConfig config_;

  std::shared_ptr<IAdmissionModel> active_model_;
  bool degraded_ = false;
  mutable std::mutex model_mutex_;
};

#endif // MODEL_MANAGER_HPP
