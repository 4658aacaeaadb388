#include "io/db/decision_store.hpp"

nlohmann::json decision_to_json(const Decision &decision) {
  nlohmann::json j = {{"id", decision.id},
                      {"url", decision.url},
                      {"mission", decision.mission},
                      {"action", action_to_string(decision.action)},
                      {"confidence", decision.confidence},
                      {"timestamp_ms", decision.timestamp_ms},
                      {"feature_count", decision.features.size()}};
  j["feedback"] = decision.feedback ? nlohmann::json(*decision.feedback)
                                    : nlohmann::json(nullptr);
  j["reward"] = decision.reward ? nlohmann::json(*decision.reward)
                                : nlohmann::json(nullptr);
  return j;
}
