#include "core/statistics.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <fstream>

namespace {

double ratio(uint64_t numerator, uint64_t denominator) {
  return denominator == 0 ? 0.0
                          : static_cast<double>(numerator) /
                                static_cast<double>(denominator);
}

} // namespace

double DecisionStatistics::accuracy() const {
  return ratio(correct_decisions, user_feedback_count);
}

double DecisionStatistics::average_reward() const {
  if (user_feedback_count == 0)
    return 0.0;
  double incorrect =
      static_cast<double>(user_feedback_count - correct_decisions);
  return (static_cast<double>(correct_decisions) - incorrect) /
         static_cast<double>(user_feedback_count);
}

double DecisionStatistics::cache_hit_rate() const {
  return ratio(cache_hits, cache_hits + total_decisions);
}

double DecisionStatistics::fast_path_rate() const {
  return ratio(fast_path_decisions, total_decisions);
}

nlohmann::json statistics_to_json(const DecisionStatistics &stats) {
  return {{"total_decisions", stats.total_decisions},
          {"correct_decisions", stats.correct_decisions},
          {"user_feedback_count", stats.user_feedback_count},
          {"cache_hits", stats.cache_hits},
          {"fast_path_decisions", stats.fast_path_decisions},
          {"average_reward", stats.average_reward()}};
}

DecisionStatistics statistics_from_json(const nlohmann::json &j) {
  DecisionStatistics stats;
  stats.total_decisions = j.value("total_decisions", uint64_t{0});
  stats.correct_decisions = j.value("correct_decisions", uint64_t{0});
  stats.user_feedback_count = j.value("user_feedback_count", uint64_t{0});
  stats.cache_hits = j.value("cache_hits", uint64_t{0});
  stats.fast_path_decisions = j.value("fast_path_decisions", uint64_t{0});
  return stats;
}

bool save_statistics_snapshot(const std::string &path,
                              const DecisionStatistics &stats) {
  if (!Utils::write_file_atomically(path, statistics_to_json(stats).dump(2))) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Failed to write statistics snapshot to " << path);
    return false;
  }
  LOG(LogLevel::DEBUG, LogComponent::STATE_PERSIST,
      "Statistics snapshot written to " << path);
  return true;
}

std::optional<DecisionStatistics>
load_statistics_snapshot(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    return std::nullopt;
  try {
    return statistics_from_json(nlohmann::json::parse(in));
  } catch (const nlohmann::json::exception &e) {
    LOG(LogLevel::WARN, LogComponent::STATE_PERSIST,
        "Ignoring unreadable statistics snapshot " << path << ": "
                                                   << e.what());
    return std::nullopt;
  }
}
