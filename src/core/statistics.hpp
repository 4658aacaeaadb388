#ifndef STATISTICS_HPP
#define STATISTICS_HPP

#include "nlohmann/json.hpp"

#include <cstdint>
#include <optional>
#include <string>

// Process-wide decision counters
struct DecisionStatistics {
  uint64_t total_decisions = 0;
  uint64_t correct_decisions = 0;
  uint64_t user_feedback_count = 0;
  uint64_t cache_hits = 0;
  uint64_t fast_path_decisions = 0;

  double accuracy() const;
  double average_reward() const; // +1 per correct, -1 per incorrect
  double cache_hit_rate() const;  // hits over hits plus fresh decisions
  double fast_path_rate() const;
};

nlohmann::json statistics_to_json(const DecisionStatistics &stats);
DecisionStatistics statistics_from_json(const nlohmann::json &j);

bool save_statistics_snapshot(const std::string &path,
                              const DecisionStatistics &stats);
std::optional<DecisionStatistics>
load_statistics_snapshot(const std::string &path);

#endif // STATISTICS_HPP
