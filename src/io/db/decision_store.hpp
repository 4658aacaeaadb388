#ifndef DECISION_STORE_HPP
#define DECISION_STORE_HPP

#include "detection/verdict.hpp"

#include "nlohmann/json.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One slow-path admission decision. Written once, then updated at most once
// when feedback arrives.
struct Decision {
  std::string id; // assigned by the store
  std::string url;
  std::string mission;
  std::vector<double> features;
  AdmissionAction action = AdmissionAction::ALLOW;
  double confidence = 0.0;
  uint64_t timestamp_ms = 0;
  std::optional<bool> feedback;
  std::optional<double> reward;
};

// Serialises everything except the feature vector, which is reported by size
nlohmann::json decision_to_json(const Decision &decision);

// Append-only decision persistence. Implementations never throw; failures
// are logged and reported through the return value.
class IDecisionStore {
public:
  virtual ~IDecisionStore() = default;

  virtual bool append(const Decision &decision) = 0;

  // Attaches feedback to the most recent decision for (url, mission) that
  // has none yet and returns the updated record
  virtual std::optional<Decision>
  attach_feedback(const std::string &url, const std::string &mission,
                  bool correct) = 0;

  // Newest first
  virtual std::vector<Decision> recent(size_t limit) = 0;

  virtual std::string backend_name() const = 0;
};

#endif // DECISION_STORE_HPP
