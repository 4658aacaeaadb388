#ifndef FEED_FORWARD_MODEL_HPP
#define FEED_FORWARD_MODEL_HPP

#include "models/base_model.hpp"

#include "nlohmann/json.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Dense ReLU network with a single sigmoid output. Dropout exists only at
// training time and is the identity here.
class FeedForwardModel : public IAdmissionModel {
public:
  static constexpr const char *FORMAT_NAME = "anchorite-ffn";
  static constexpr int FORMAT_VERSION = 1;
  static constexpr std::array<size_t, 3> HIDDEN_LAYER_SIZES = {256, 128, 64};

  struct DenseLayer {
    size_t in = 0;
    size_t out = 0;
    std::vector<double> weights; // row-major, out x in
    std::vector<double> bias;
  };

  // Both loaders throw ModelLoadError on any format, version or shape mismatch
  static FeedForwardModel load_from_file(const std::string &path);
  static FeedForwardModel from_json(const nlohmann::json &document);

  // Fixed-seed initialisation used when no weights can be loaded
  static FeedForwardModel untrained(size_t input_size, uint64_t seed);

  double predict_probability(const std::vector<double> &features) override;
  size_t input_size() const override;
  std::string kind() const override { return kind_; }

  const std::vector<DenseLayer> &layers() const { return layers_; }

  nlohmann::json to_json() const;

private:
  FeedForwardModel(std::vector<DenseLayer> layers, std::string kind);

  std::vector<DenseLayer> layers_;
  std::string kind_;
};

#endif // FEED_FORWARD_MODEL_HPP
