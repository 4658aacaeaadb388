#ifndef DECISION_ENGINE_HPP
#define DECISION_ENGINE_HPP

#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "core/mission.hpp"
#include "core/statistics.hpp"
#include "detection/decision_cache.hpp"
#include "detection/rule_engine.hpp"
#include "detection/verdict.hpp"
#include "io/db/decision_store.hpp"
#include "io/metadata/bounded_metadata_source.hpp"
#include "models/feature_extractor.hpp"
#include "models/model_manager.hpp"

#include "nlohmann/json.hpp"

#include <array>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct EngineStatistics {
  DecisionStatistics counters;
  double decision_threshold = 0.5;
  std::string model_kind;
  bool model_degraded = false;
  size_t cache_entries = 0;
};

nlohmann::json engine_statistics_to_json(const EngineStatistics &stats);

// Orchestrates the rule tier, the decision cache, the classifier and the
// decision store. Both entry points are fail-open: an internal error yields
// an ALLOW verdict with source FAIL_OPEN.
class DecisionEngine {
public:
  static constexpr size_t RECENT_VERDICT_CAPACITY = 256;

  // `metadata_source` may be null, in which case URL-only metadata is
  // classified as supplied.
  DecisionEngine(const Config::AppConfig &config, ModelManager &models,
                 IDecisionStore &store, MetricsRegistry &metrics,
                 BoundedMetadataSource *metadata_source = nullptr);
  ~DecisionEngine();

  DecisionEngine(const DecisionEngine &) = delete;
  DecisionEngine &operator=(const DecisionEngine &) = delete;

  // Fast path: cache, then the rule tier. Never blocks on I/O.
  Verdict decide(const std::string &url);

  // Rule tier, then cache, then the classifier. URL-only metadata is
  // enriched through the metadata source only when a watch endpoint needs
  // page text or the request is headed for the classifier.
  Verdict decide_with_metadata(PageMetadata metadata);

  // Returns false when no decision for (url, current mission) is waiting
  // for feedback
  bool submit_feedback(const std::string &url, bool correct);

  void set_mission(Mission mission);
  void clear_mission();
  std::shared_ptr<const Mission> mission() const;

  void clear_cache();
  size_t cache_size() const;

  EngineStatistics statistics() const;
  bool flush_statistics();

  // Newest first
  std::vector<VerdictLogEntry> recent_verdicts(size_t limit) const;

private:
  Verdict fail_open(const std::string &url, const std::exception &error);
  // Counts a rule-tier verdict as a fast-path decision and caches it
  Verdict record_rule_verdict(const std::string &url, const RuleVerdict &rule);
  void record_verdict_locked(const std::string &url, const Verdict &verdict);
  static std::string page_text_of(const PageMetadata &metadata);

  Config::AppConfig config_;
  ModelManager &models_;
  IDecisionStore &store_;
  BoundedMetadataSource *metadata_source_;

  RuleEngine rules_;
  FeatureExtractor extractor_;

  // Guards everything below
  mutable std::mutex mutex_;
  DecisionCache cache_;
  DecisionStatistics stats_;
  std::shared_ptr<const Mission> mission_;
  std::deque<VerdictLogEntry> recent_;

  std::array<prometheus::Counter *, 4> decisions_by_source_{};
  prometheus::Counter *feedback_correct_ = nullptr;
  prometheus::Counter *feedback_incorrect_ = nullptr;
  prometheus::Histogram *fast_path_latency_ = nullptr;
  prometheus::Histogram *slow_path_latency_ = nullptr;
};

#endif // DECISION_ENGINE_HPP
