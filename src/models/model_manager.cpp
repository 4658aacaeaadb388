#include "models/model_manager.hpp"
#include "core/logger.hpp"
#include "models/feature_extractor.hpp"
#include "models/feed_forward_model.hpp"
#include "models/onnx_model.hpp"
#include "utils/utils.hpp"

ModelManager::ModelManager(const Config::ClassifierConfig &config)
    : config_(config) {
  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE, "ModelManager created.");
  if (!config_.enabled) {
    LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
        "Classifier is disabled. No model will be loaded.");
    return;
  }
  load_initial_model();
}

ModelManager::ModelManager(const Config::ClassifierConfig &config,
                           std::shared_ptr<IAdmissionModel> injected_model)
    : config_(config), active_model_(std::move(injected_model)) {
  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "ModelManager created with an injected "
          << (active_model_ ? active_model_->kind() : "null") << " model.");
}

void ModelManager::load_initial_model() {
  std::shared_ptr<IAdmissionModel> model;
  try {
    if (Utils::ends_with(Utils::to_lower_copy(config_.model_path), ".onnx"))
      model = std::make_shared<OnnxAdmissionModel>(
          config_.model_path, FeatureLayout::FEATURE_COUNT);
    else
      model = std::make_shared<FeedForwardModel>(
          FeedForwardModel::load_from_file(config_.model_path));
  } catch (const ModelLoadError &e) {
    LOG(LogLevel::WARN, LogComponent::ML_LIFECYCLE,
        "Could not load classifier weights: "
            << e.what()
            << ". Serving with an untrained network; slow-path decisions "
               "are near-random until weights are provided.");
    model = std::make_shared<FeedForwardModel>(FeedForwardModel::untrained(
        FeatureLayout::FEATURE_COUNT, config_.untrained_seed));
    degraded_ = true;
  }

  std::lock_guard<std::mutex> lock(model_mutex_);
  active_model_ = std::move(model);
  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "Active classifier: " << active_model_->kind()
                            << (degraded_ ? " (degraded)" : ""));
}

std::shared_ptr<IAdmissionModel> ModelManager::get_active_model() const {
  std::lock_guard<std::mutex> lock(model_mutex_);
  return active_model_;
}

bool ModelManager::is_degraded() const {
  std::lock_guard<std::mutex> lock(model_mutex_);
  return degraded_;
}

std::string ModelManager::model_kind() const {
  std::lock_guard<std::mutex> lock(model_mutex_);
  if (!active_model_)
    return "disabled";
  return active_model_->kind();
}
