#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <limits>
#include <mutex>
#include <queue>

// Multi-producer multi-consumer queue with an optional capacity bound.
template <typename T> class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(
      size_t capacity = std::numeric_limits<size_t>::max())
      : capacity_(capacity) {}

  // Returns false when the queue is full or shut down; the value is untouched
  bool try_push(T &value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutdown_requested_ || queue_.size() >= capacity_)
        return false;
      queue_.push(std::move(value));
    }
    cond_.notify_one();
    return true;
  }

  // A blocking wait_and_pop that returns false on shutdown
  bool wait_and_pop(T &value) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_; });
    if (shutdown_requested_ && queue_.empty())
      return false;

    value = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  // Wakes every waiter; queued items can still be drained
  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shutdown_requested_ = true;
    }
    cond_.notify_all();
  }

private:
  const size_t capacity_;
  std::mutex mutex_;
  std::queue<T> queue_;
  std::condition_variable cond_;
  bool shutdown_requested_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
