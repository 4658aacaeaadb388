#ifndef DECISION_CACHE_HPP
#define DECISION_CACHE_HPP

#include "detection/verdict.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

// TTL cache keyed by the raw URL string. Entries are evicted lazily on a read
// after expiry or by clear(). Not mission-aware and not thread-safe: the
// owner guards it with its own lock.
class DecisionCache {
public:
  struct CacheEntry {
    Verdict verdict;
    uint64_t stored_at_ms = 0;
  };

  explicit DecisionCache(uint64_t ttl_ms);

  std::optional<Verdict> get(const std::string &url);
  std::optional<Verdict> get(const std::string &url, uint64_t now_ms);

  void put(const std::string &url, const Verdict &verdict);
  void put(const std::string &url, const Verdict &verdict, uint64_t now_ms);

  void clear();
  size_t size() const { return entries_.size(); }
  uint64_t ttl_ms() const { return ttl_ms_; }

private:
  uint64_t ttl_ms_;
  std::unordered_map<std::string, CacheEntry> entries_;
};

#endif // DECISION_CACHE_HPP
