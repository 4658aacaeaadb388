#include "detection/decision_cache.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

DecisionCache::DecisionCache(uint64_t ttl_ms) : ttl_ms_(ttl_ms) {}

std::optional<Verdict> DecisionCache::get(const std::string &url) {
  return get(url, Utils::get_current_time_ms());
}

std::optional<Verdict> DecisionCache::get(const std::string &url,
                                          uint64_t now_ms) {
  auto it = entries_.find(url);
  if (it == entries_.end())
    return std::nullopt;

  // A clock step backwards counts as age zero
  uint64_t age =
      now_ms >= it->second.stored_at_ms ? now_ms - it->second.stored_at_ms : 0;
  if (age < ttl_ms_)
    return it->second.verdict;

  LOG(LogLevel::TRACE, LogComponent::DECISION_CACHE,
      "Evicting expired entry for " << url << " (age " << age << "ms)");
  entries_.erase(it);
  return std::nullopt;
}

void DecisionCache::put(const std::string &url, const Verdict &verdict) {
  put(url, verdict, Utils::get_current_time_ms());
}

void DecisionCache::put(const std::string &url, const Verdict &verdict,
                        uint64_t now_ms) {
  entries_[url] = CacheEntry{verdict, now_ms};
}

void DecisionCache::clear() {
  LOG(LogLevel::INFO, LogComponent::DECISION_CACHE,
      "Decision cache cleared (" << entries_.size() << " entries dropped)");
  entries_.clear();
}
