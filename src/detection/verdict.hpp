#ifndef VERDICT_HPP
#define VERDICT_HPP

#include <cstdint>
#include <string>

enum class AdmissionAction { ALLOW, BLOCK };

// Where a verdict came from
enum class VerdictSource { RULE_TIER, CACHE, CLASSIFIER, FAIL_OPEN };

struct Verdict {
  AdmissionAction action = AdmissionAction::ALLOW;
  double confidence = 1.0;
  VerdictSource source = VerdictSource::RULE_TIER;
  std::string reason;

  bool allowed() const { return action == AdmissionAction::ALLOW; }
};

// Observability record of one answered request
struct VerdictLogEntry {
  std::string url;
  Verdict verdict;
  uint64_t timestamp_ms = 0;
};

inline const char *action_to_string(AdmissionAction action) {
  switch (action) {
  case AdmissionAction::ALLOW:
    return "ALLOW";
  case AdmissionAction::BLOCK:
    return "BLOCK";
  }
  return "UNKNOWN";
}

inline const char *source_to_string(VerdictSource source) {
  switch (source) {
  case VerdictSource::RULE_TIER:
    return "RULE_TIER";
  case VerdictSource::CACHE:
    return "CACHE";
  case VerdictSource::CLASSIFIER:
    return "CLASSIFIER";
  case VerdictSource::FAIL_OPEN:
    return "FAIL_OPEN";
  }
  return "UNKNOWN";
}

#endif // VERDICT_HPP
