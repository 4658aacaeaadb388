#ifndef ONNX_MODEL_HPP
#define ONNX_MODEL_HPP

#include "models/base_model.hpp"
#include <onnxruntime_cxx_api.h>
#include <string>
#include <vector>

// onnxruntime backend for an exported admission network with one float input
// of shape [N, features] and one probability output of shape [N, 1].
class OnnxAdmissionModel : public IAdmissionModel {
public:
  // Throws ModelLoadError when the session cannot be created or the graph
  // does not have the expected signature
  OnnxAdmissionModel(const std::string &model_path, size_t expected_features);
  ~OnnxAdmissionModel() override;

  double predict_probability(const std::vector<double> &features) override;
  size_t input_size() const override { return input_size_; }
  std::string kind() const override { return "onnx"; }

private:
  // ONNX Runtime objects
  Ort::Env env_;
  Ort::Session session_;
  Ort::AllocatorWithDefaultOptions allocator_;

  std::vector<const char *> input_node_names_;
  std::vector<const char *> output_node_names_;
  std::vector<std::string> owned_input_names_;
  std::vector<std::string> owned_output_names_;
  size_t input_size_ = 0;
};

#endif // ONNX_MODEL_HPP
