#include "models/feed_forward_model.hpp"
#include "core/logger.hpp"
#include "models/features.hpp"

#include <cmath>
#include <fstream>
#include <random>

using json = nlohmann::json;

namespace {

std::vector<size_t> expected_widths(size_t input_size) {
  std::vector<size_t> widths{input_size};
  for (size_t hidden : FeedForwardModel::HIDDEN_LAYER_SIZES)
    widths.push_back(hidden);
  widths.push_back(1);
  return widths;
}

double sigmoid(double x) {
  if (x >= 0.0)
    return 1.0 / (1.0 + std::exp(-x));
  double e = std::exp(x);
  return e / (1.0 + e);
}

FeedForwardModel::DenseLayer parse_layer(const json &j, size_t index) {
  FeedForwardModel::DenseLayer layer;
  layer.in = j.at("in").get<size_t>();
  layer.out = j.at("out").get<size_t>();
  layer.weights = j.at("weights").get<std::vector<double>>();
  layer.bias = j.at("bias").get<std::vector<double>>();

  if (layer.weights.size() != layer.in * layer.out)
    throw ModelLoadError("layer " + std::to_string(index) + " has " +
                         std::to_string(layer.weights.size()) +
                         " weights, expected " +
                         std::to_string(layer.in * layer.out));
  if (layer.bias.size() != layer.out)
    throw ModelLoadError("layer " + std::to_string(index) + " has " +
                         std::to_string(layer.bias.size()) +
                         " biases, expected " + std::to_string(layer.out));
  return layer;
}

} // namespace

FeedForwardModel::FeedForwardModel(std::vector<DenseLayer> layers,
                                   std::string kind)
    : layers_(std::move(layers)), kind_(std::move(kind)) {}

FeedForwardModel FeedForwardModel::load_from_file(const std::string &path) {
  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "Loading feed-forward weights from: " << path);
  std::ifstream f(path);
  if (!f.is_open())
    throw ModelLoadError("could not open weight file: " + path);

  json document;
  try {
    document = json::parse(f);
  } catch (const json::parse_error &e) {
    throw ModelLoadError("weight file " + path +
                         " is not valid JSON: " + e.what());
  }
  return from_json(document);
}

FeedForwardModel FeedForwardModel::from_json(const json &document) {
  try {
    if (document.at("format").get<std::string>() != FORMAT_NAME)
      throw ModelLoadError("unexpected weight file format '" +
                           document.at("format").get<std::string>() + "'");
    int format_version = document.at("format_version").get<int>();
    if (format_version != FORMAT_VERSION)
      throw ModelLoadError("unsupported weight format_version " +
                           std::to_string(format_version));
    int schema = document.at("feature_schema_version").get<int>();
    if (schema != FeatureLayout::SCHEMA_VERSION)
      throw ModelLoadError(
          "weights were trained on feature schema " + std::to_string(schema) +
          ", runtime uses " + std::to_string(FeatureLayout::SCHEMA_VERSION));

    const auto widths = expected_widths(FeatureLayout::FEATURE_COUNT);
    const json &layer_docs = document.at("layers");
    if (!layer_docs.is_array() || layer_docs.size() != widths.size() - 1)
      throw ModelLoadError("expected " + std::to_string(widths.size() - 1) +
                           " layers");

    std::vector<DenseLayer> layers;
    layers.reserve(layer_docs.size());
    for (size_t i = 0; i < layer_docs.size(); ++i) {
      DenseLayer layer = parse_layer(layer_docs[i], i);
      if (layer.in != widths[i] || layer.out != widths[i + 1])
        throw ModelLoadError("layer " + std::to_string(i) + " is " +
                             std::to_string(layer.in) + "x" +
                             std::to_string(layer.out) + ", expected " +
                             std::to_string(widths[i]) + "x" +
                             std::to_string(widths[i + 1]));
      layers.push_back(std::move(layer));
    }

    LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
        "Feed-forward model loaded (" << layers.size() << " layers).");
    return FeedForwardModel(std::move(layers), "feed-forward");
  } catch (const json::exception &e) {
    throw ModelLoadError(std::string("malformed weight document: ") +
                         e.what());
  }
}

FeedForwardModel FeedForwardModel::untrained(size_t input_size,
                                             uint64_t seed) {
  std::mt19937_64 rng(seed);
  const auto widths = expected_widths(input_size);

  std::vector<DenseLayer> layers;
  for (size_t i = 0; i + 1 < widths.size(); ++i) {
    DenseLayer layer;
    layer.in = widths[i];
    layer.out = widths[i + 1];
    const double bound = 1.0 / std::sqrt(static_cast<double>(layer.in));
    std::uniform_real_distribution<double> dist(-bound, bound);

    layer.weights.resize(layer.in * layer.out);
    for (auto &w : layer.weights)
      w = dist(rng);
    layer.bias.resize(layer.out);
    for (auto &b : layer.bias)
      b = dist(rng);
    layers.push_back(std::move(layer));
  }
  LOG(LogLevel::DEBUG, LogComponent::ML_LIFECYCLE,
      "Built untrained network with seed " << seed);
  return FeedForwardModel(std::move(layers), "untrained");
}

size_t FeedForwardModel::input_size() const {
  return layers_.empty() ? 0 : layers_.front().in;
}

double
FeedForwardModel::predict_probability(const std::vector<double> &features) {
  if (features.size() != input_size())
    throw std::invalid_argument("feature vector has " +
                                std::to_string(features.size()) +
                                " values, model expects " +
                                std::to_string(input_size()));

  std::vector<double> activation = features;
  std::vector<double> next;
  for (size_t l = 0; l < layers_.size(); ++l) {
    const DenseLayer &layer = layers_[l];
    next.assign(layer.bias.begin(), layer.bias.end());
    for (size_t o = 0; o < layer.out; ++o) {
      const double *row = layer.weights.data() + o * layer.in;
      double sum = 0.0;
      for (size_t i = 0; i < layer.in; ++i)
        sum += row[i] * activation[i];
      next[o] += sum;
    }
    if (l + 1 < layers_.size()) {
      for (auto &v : next)
        v = v > 0.0 ? v : 0.0;
    }
    activation.swap(next);
  }

  double probability = sigmoid(activation.front());
  LOG(LogLevel::TRACE, LogComponent::ML_INFERENCE,
      "Feed-forward logit " << activation.front() << " -> p=" << probability);
  return probability;
}

json FeedForwardModel::to_json() const {
  json layer_docs = json::array();
  for (const auto &layer : layers_)
    layer_docs.push_back({{"in", layer.in},
                          {"out", layer.out},
                          {"weights", layer.weights},
                          {"bias", layer.bias}});
  return {{"format", FORMAT_NAME},
          {"format_version", FORMAT_VERSION},
          {"feature_schema_version", FeatureLayout::SCHEMA_VERSION},
          {"layers", layer_docs}};
}
