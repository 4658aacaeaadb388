#include "json_formatter.hpp"

nlohmann::json JsonFormatter::verdict_to_json(const Verdict &verdict) {
  nlohmann::json j;
  j["allowed"] = verdict.allowed();
  j["action"] = action_to_string(verdict.action);
  j["confidence"] = verdict.confidence;
  j["source"] = source_to_string(verdict.source);
  j["reason"] = verdict.reason;
  return j;
}

nlohmann::json
JsonFormatter::verdict_log_entry_to_json(const VerdictLogEntry &entry) {
  nlohmann::json j = verdict_to_json(entry.verdict);
  j["url"] = entry.url;
  j["timestamp_ms"] = entry.timestamp_ms;
  return j;
}
