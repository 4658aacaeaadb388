#include "detection/decision_engine.hpp"
#include "core/logger.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <sstream>

namespace {

const std::vector<double> LATENCY_BUCKETS = {0.0001, 0.0005, 0.001, 0.005,
                                             0.01,   0.05,   0.1,   0.5,
                                             1.0,    2.5};

bool is_url_only(const PageMetadata &metadata) {
  return metadata.title.empty() && metadata.description.empty() &&
         metadata.extracted_text.empty() && metadata.video_title.empty() &&
         metadata.video_description.empty();
}

} // namespace

nlohmann::json engine_statistics_to_json(const EngineStatistics &stats) {
  nlohmann::json j = statistics_to_json(stats.counters);
  j["accuracy"] = stats.counters.accuracy();
  j["cache_hit_rate"] = stats.counters.cache_hit_rate();
  j["fast_path_rate"] = stats.counters.fast_path_rate();
  j["decision_threshold"] = stats.decision_threshold;
  j["model_kind"] = stats.model_kind;
  j["model_degraded"] = stats.model_degraded;
  j["cache_entries"] = stats.cache_entries;
  return j;
}

DecisionEngine::DecisionEngine(const Config::AppConfig &config,
                               ModelManager &models, IDecisionStore &store,
                               MetricsRegistry &metrics,
                               BoundedMetadataSource *metadata_source)
    : config_(config), models_(models), store_(store),
      metadata_source_(metadata_source), rules_(config.rule_tier),
      cache_(config.cache.ttl_seconds * 1000) {
  auto &decisions = metrics.create_counter_family(
      "anchorite_decisions_total", "Admission verdicts by source.");
  for (VerdictSource source :
       {VerdictSource::RULE_TIER, VerdictSource::CACHE,
        VerdictSource::CLASSIFIER, VerdictSource::FAIL_OPEN})
    decisions_by_source_[static_cast<size_t>(source)] =
        &decisions.Add({{"source", source_to_string(source)}});

  auto &feedback = metrics.create_counter_family(
      "anchorite_feedback_total", "Feedback events attached to decisions.");
  feedback_correct_ = &feedback.Add({{"correct", "true"}});
  feedback_incorrect_ = &feedback.Add({{"correct", "false"}});

  auto &latency = metrics.create_histogram_family(
      "anchorite_decision_latency_seconds",
      "Latency of admission decisions by path.");
  fast_path_latency_ = &latency.Add({{"path", "fast"}}, LATENCY_BUCKETS);
  slow_path_latency_ = &latency.Add({{"path", "slow"}}, LATENCY_BUCKETS);

  if (auto restored = load_statistics_snapshot(config_.stats_snapshot_path)) {
    stats_ = *restored;
    LOG(LogLevel::INFO, LogComponent::DECISION_ENGINE,
        "Restored decision statistics (" << stats_.total_decisions
                                         << " decisions, "
                                         << stats_.user_feedback_count
                                         << " feedback events).");
  }

  LOG(LogLevel::INFO, LogComponent::DECISION_ENGINE,
      "DecisionEngine ready. Store: "
          << store_.backend_name() << ", classifier: " << models_.model_kind()
          << ", cache TTL: " << config_.cache.ttl_seconds << "s.");
}

DecisionEngine::~DecisionEngine() { flush_statistics(); }

Verdict DecisionEngine::decide(const std::string &url) {
  ScopedTimer timer(*fast_path_latency_);
  try {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (auto cached = cache_.get(url)) {
        ++stats_.cache_hits;
        Verdict verdict = *cached;
        verdict.source = VerdictSource::CACHE;
        record_verdict_locked(url, verdict);
        LOG(LogLevel::TRACE, LogComponent::DECISION_CACHE,
            "Cache hit for " << url);
        return verdict;
      }
    }

    std::shared_ptr<const Mission> active_mission = mission();
    return record_rule_verdict(url, rules_.evaluate(url, active_mission.get()));
  } catch (const std::exception &e) {
    return fail_open(url, e);
  }
}

Verdict DecisionEngine::decide_with_metadata(PageMetadata metadata) {
  ScopedTimer timer(*slow_path_latency_);
  const std::string url = metadata.url;
  try {
    std::shared_ptr<const Mission> active_mission = mission();
    const bool has_mission = active_mission && !active_mission->empty();
    const bool can_enrich = metadata_source_ != nullptr && is_url_only(metadata);

    // Rules first, on whatever text the caller sent. Only a watch endpoint
    // reads page text, so only it is worth a fetch.
    RuleVerdict rule =
        rules_.evaluate(url, active_mission.get(), page_text_of(metadata));
    const bool needs_page_text =
        rule.tier == RuleTier::WATCH_ENDPOINT && can_enrich && has_mission;
    if (rule.tier != RuleTier::DEFAULT && !needs_page_text)
      return record_rule_verdict(url, rule);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (auto cached = cache_.get(url)) {
        ++stats_.cache_hits;
        Verdict verdict = *cached;
        verdict.source = VerdictSource::CACHE;
        record_verdict_locked(url, verdict);
        return verdict;
      }
    }

    if (needs_page_text) {
      metadata = metadata_source_->fetch(url);
      return record_rule_verdict(
          url, rules_.evaluate(url, active_mission.get(),
                               page_text_of(metadata)));
    }

    if (!has_mission) {
      Verdict verdict{AdmissionAction::ALLOW, 1.0, VerdictSource::FAIL_OPEN,
                      "no active mission"};
      LOG(LogLevel::DEBUG, LogComponent::DECISION_ENGINE,
          "No mission set, allowing " << url);
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.total_decisions;
      record_verdict_locked(url, verdict);
      return verdict;
    }

    std::shared_ptr<IAdmissionModel> model = models_.get_active_model();
    if (!model) {
      rule.reason = "classifier disabled";
      return record_rule_verdict(url, rule);
    }

    if (can_enrich)
      metadata = metadata_source_->fetch(url);

    std::vector<double> features =
        extractor_.extract(metadata, active_mission->text, TimeContext::now());
    const double probability = model->predict_probability(features);
    const double threshold = models_.decision_threshold();
    // Equality blocks
    const AdmissionAction action = probability > threshold
                                       ? AdmissionAction::ALLOW
                                       : AdmissionAction::BLOCK;

    std::ostringstream reason;
    reason << "classifier p=" << probability;
    Verdict verdict{action, probability, VerdictSource::CLASSIFIER,
                    reason.str()};
    LOG(LogLevel::INFO, LogComponent::DECISION_ENGINE,
        action_to_string(action) << ": " << url << " (p=" << probability
                                 << ", threshold=" << threshold << ")");

    Decision decision;
    decision.url = url;
    decision.mission = active_mission->text;
    decision.features = std::move(features);
    decision.action = action;
    decision.confidence = probability;
    decision.timestamp_ms = Utils::get_current_time_ms();
    if (!store_.append(decision))
      LOG(LogLevel::WARN, LogComponent::DECISION_ENGINE,
          "Decision for " << url << " was returned but not recorded.");

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.total_decisions;
    cache_.put(url, verdict);
    record_verdict_locked(url, verdict);
    return verdict;
  } catch (const std::exception &e) {
    return fail_open(url, e);
  }
}

bool DecisionEngine::submit_feedback(const std::string &url, bool correct) {
  std::shared_ptr<const Mission> active_mission = mission();
  const std::string mission_text = active_mission ? active_mission->text : "";

  std::optional<Decision> updated =
      store_.attach_feedback(url, mission_text, correct);
  if (!updated) {
    LOG(LogLevel::DEBUG, LogComponent::DECISION_ENGINE,
        "No decision awaiting feedback for " << url);
    return false;
  }

  bool flush_due = false;
  DecisionStatistics snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.user_feedback_count;
    if (correct)
      ++stats_.correct_decisions;
    flush_due =
        stats_.user_feedback_count % config_.statistics.flush_every_feedback ==
        0;
    snapshot = stats_;
  }
  (correct ? feedback_correct_ : feedback_incorrect_)->Increment();

  LOG(LogLevel::INFO, LogComponent::DECISION_ENGINE,
      "Feedback for decision " << updated->id << " (" << url
                               << "): " << (correct ? "correct" : "incorrect"));
  if (flush_due)
    save_statistics_snapshot(config_.stats_snapshot_path, snapshot);
  return true;
}

void DecisionEngine::set_mission(Mission new_mission) {
  auto shared = std::make_shared<const Mission>(std::move(new_mission));
  LOG(LogLevel::INFO, LogComponent::DECISION_ENGINE,
      "Mission set: '" << shared->text << "' (" << shared->keywords.size()
                       << " keywords, " << shared->allowed_domains.size()
                       << " allowed domains)");
  std::lock_guard<std::mutex> lock(mutex_);
  mission_ = std::move(shared);
}

void DecisionEngine::clear_mission() {
  std::lock_guard<std::mutex> lock(mutex_);
  mission_.reset();
}

std::shared_ptr<const Mission> DecisionEngine::mission() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mission_;
}

void DecisionEngine::clear_cache() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
}

size_t DecisionEngine::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

EngineStatistics DecisionEngine::statistics() const {
  EngineStatistics result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result.counters = stats_;
    result.cache_entries = cache_.size();
  }
  result.decision_threshold = models_.decision_threshold();
  result.model_kind = models_.model_kind();
  result.model_degraded = models_.is_degraded();
  return result;
}

bool DecisionEngine::flush_statistics() {
  DecisionStatistics snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = stats_;
  }
  return save_statistics_snapshot(config_.stats_snapshot_path, snapshot);
}

std::vector<VerdictLogEntry>
DecisionEngine::recent_verdicts(size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<VerdictLogEntry> result;
  for (auto it = recent_.rbegin(); it != recent_.rend() && result.size() < limit;
       ++it)
    result.push_back(*it);
  return result;
}

Verdict DecisionEngine::fail_open(const std::string &url,
                                  const std::exception &error) {
  LOG(LogLevel::ERROR, LogComponent::DECISION_ENGINE,
      "Internal error while deciding " << url << ": " << error.what()
                                       << ". Failing open.");
  Verdict verdict{AdmissionAction::ALLOW, 0.0, VerdictSource::FAIL_OPEN,
                  "internal error"};
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.total_decisions;
  record_verdict_locked(url, verdict);
  return verdict;
}

Verdict DecisionEngine::record_rule_verdict(const std::string &url,
                                            const RuleVerdict &rule) {
  Verdict verdict{rule.action, 1.0, VerdictSource::RULE_TIER, rule.reason};
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.total_decisions;
  ++stats_.fast_path_decisions;
  cache_.put(url, verdict);
  record_verdict_locked(url, verdict);
  return verdict;
}

void DecisionEngine::record_verdict_locked(const std::string &url,
                                           const Verdict &verdict) {
  decisions_by_source_[static_cast<size_t>(verdict.source)]->Increment();
  recent_.push_back(VerdictLogEntry{url, verdict, Utils::get_current_time_ms()});
  if (recent_.size() > RECENT_VERDICT_CAPACITY)
    recent_.pop_front();
}

std::string DecisionEngine::page_text_of(const PageMetadata &metadata) {
  std::string text;
  for (const std::string *part :
       {&metadata.video_title, &metadata.video_description, &metadata.title,
        &metadata.description}) {
    if (part->empty())
      continue;
    if (!text.empty())
      text.push_back(' ');
    text += *part;
  }
  return text;
}
