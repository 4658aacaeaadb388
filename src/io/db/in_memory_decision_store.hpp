#ifndef IN_MEMORY_DECISION_STORE_HPP
#define IN_MEMORY_DECISION_STORE_HPP

#include "io/db/decision_store.hpp"

#include <cstddef>
#include <deque>
#include <mutex>

// Process-local store with sequential ids. Default backend. Holds at most
// `capacity` decisions; the oldest is dropped to make room.
class InMemoryDecisionStore : public IDecisionStore {
public:
  static constexpr size_t DEFAULT_CAPACITY = 10000;

  explicit InMemoryDecisionStore(size_t capacity = DEFAULT_CAPACITY);

  bool append(const Decision &decision) override;
  std::optional<Decision> attach_feedback(const std::string &url,
                                          const std::string &mission,
                                          bool correct) override;
  std::vector<Decision> recent(size_t limit) override;
  std::string backend_name() const override { return "memory"; }

  size_t size() const;
  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<Decision> decisions_;
  uint64_t next_id_ = 1;
};

#endif // IN_MEMORY_DECISION_STORE_HPP
