#include "models/onnx_model.hpp"
#include "core/logger.hpp"

#include <array>

OnnxAdmissionModel::OnnxAdmissionModel(const std::string &model_path,
                                       size_t expected_features) try
    : env_(ORT_LOGGING_LEVEL_WARNING, "anchorite-onnx"),
      session_(env_, model_path.c_str(), Ort::SessionOptions{nullptr}) {

  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "Loaded ONNX session from: " << model_path);

  if (session_.GetInputCount() != 1)
    throw ModelLoadError("model must have exactly one input node");
  if (session_.GetOutputCount() != 1)
    throw ModelLoadError("model must have exactly one output node");

  owned_input_names_.push_back(
      session_.GetInputNameAllocated(0, allocator_).get());
  input_node_names_.push_back(owned_input_names_.back().c_str());
  owned_output_names_.push_back(
      session_.GetOutputNameAllocated(0, allocator_).get());
  output_node_names_.push_back(owned_output_names_.back().c_str());
  LOG(LogLevel::DEBUG, LogComponent::ML_LIFECYCLE,
      "Model input node '" << input_node_names_[0] << "', output node '"
                           << output_node_names_[0] << "'");

  Ort::TypeInfo type_info = session_.GetInputTypeInfo(0);
  auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
  std::vector<int64_t> dims = tensor_info.GetShape();
  if (dims.size() != 2 || dims[1] <= 0)
    throw ModelLoadError(
        "model input must be a 2D tensor of shape [N, num_features]");
  input_size_ = static_cast<size_t>(dims[1]);
  if (input_size_ != expected_features)
    throw ModelLoadError("model expects " + std::to_string(input_size_) +
                         " features, runtime produces " +
                         std::to_string(expected_features));

  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "ONNX admission model ready (" << input_size_ << " features).");

} catch (const Ort::Exception &e) {
  throw ModelLoadError(std::string("ONNX Runtime failed to load ") +
                       model_path + ": " + e.what());
}

OnnxAdmissionModel::~OnnxAdmissionModel() = default;

double
OnnxAdmissionModel::predict_probability(const std::vector<double> &features) {
  if (features.size() != input_size_)
    throw std::invalid_argument("feature vector has " +
                                std::to_string(features.size()) +
                                " values, model expects " +
                                std::to_string(input_size_));

  // ONNX Runtime wants float input
  std::vector<float> float_features(features.begin(), features.end());
  std::array<int64_t, 2> shape{1, static_cast<int64_t>(input_size_)};

  Ort::MemoryInfo memory_info =
      Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      memory_info, float_features.data(), float_features.size(), shape.data(),
      shape.size());

  try {
    auto output_tensors =
        session_.Run(Ort::RunOptions{nullptr}, input_node_names_.data(),
                     &input_tensor, 1, output_node_names_.data(),
                     output_node_names_.size());
    double probability =
        static_cast<double>(output_tensors[0].GetTensorData<float>()[0]);
    LOG(LogLevel::TRACE, LogComponent::ML_INFERENCE,
        "ONNX model probability: " << probability);
    return probability;
  } catch (const Ort::Exception &e) {
    throw std::runtime_error(std::string("ONNX inference failed: ") +
                             e.what());
  }
}
