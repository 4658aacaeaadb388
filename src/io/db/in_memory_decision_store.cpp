#include "io/db/in_memory_decision_store.hpp"
#include "core/logger.hpp"

InMemoryDecisionStore::InMemoryDecisionStore(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

bool InMemoryDecisionStore::append(const Decision &decision) {
  std::lock_guard<std::mutex> lock(mutex_);
  while (decisions_.size() >= capacity_)
    decisions_.pop_front();
  decisions_.push_back(decision);
  decisions_.back().id = std::to_string(next_id_++);
  LOG(LogLevel::TRACE, LogComponent::IO_DATABASE,
      "Recorded decision " << decisions_.back().id << " for "
                           << decision.url);
  return true;
}

std::optional<Decision>
InMemoryDecisionStore::attach_feedback(const std::string &url,
                                       const std::string &mission,
                                       bool correct) {
  std::lock_guard<std::mutex> lock(mutex_);
  // Insertion order is chronological
  for (auto it = decisions_.rbegin(); it != decisions_.rend(); ++it) {
    if (it->url != url || it->mission != mission || it->feedback)
      continue;
    it->feedback = correct;
    it->reward = correct ? 1.0 : -1.0;
    return *it;
  }
  return std::nullopt;
}

std::vector<Decision> InMemoryDecisionStore::recent(size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Decision> result;
  for (auto it = decisions_.rbegin();
       it != decisions_.rend() && result.size() < limit; ++it)
    result.push_back(*it);
  return result;
}

size_t InMemoryDecisionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return decisions_.size();
}
