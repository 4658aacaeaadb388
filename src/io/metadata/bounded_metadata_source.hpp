#ifndef BOUNDED_METADATA_SOURCE_HPP
#define BOUNDED_METADATA_SOURCE_HPP

#include "core/config.hpp"
#include "io/metadata/metadata_fetcher.hpp"
#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Puts a caller-side deadline and a fixed worker pool around a fetcher.
// fetch() never waits longer than wait_timeout_ms and never throws: on a
// deadline, a full queue or a fetcher error it returns PageMetadata::basic.
class BoundedMetadataSource {
public:
  struct Counters {
    uint64_t completed = 0;
    uint64_t timeouts = 0;
    uint64_t overflows = 0;
    uint64_t failures = 0;
  };

  BoundedMetadataSource(std::shared_ptr<IMetadataFetcher> fetcher,
                        const Config::MetadataFetchConfig &config);
  ~BoundedMetadataSource();

  BoundedMetadataSource(const BoundedMetadataSource &) = delete;
  BoundedMetadataSource &operator=(const BoundedMetadataSource &) = delete;

  PageMetadata fetch(const std::string &url);

  size_t worker_count() const { return workers_.size(); }
  Counters counters() const;

private:
  struct FetchTask {
    std::string url;
    std::promise<PageMetadata> result;
  };

  void worker_loop();

  std::shared_ptr<IMetadataFetcher> fetcher_;
  Config::MetadataFetchConfig config_;
  ThreadSafeQueue<std::shared_ptr<FetchTask>> pending_;
  std::vector<std::thread> workers_;
  std::atomic<bool> stopping_{false};

  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> timeouts_{0};
  std::atomic<uint64_t> overflows_{0};
  std::atomic<uint64_t> failures_{0};
};

#endif // BOUNDED_METADATA_SOURCE_HPP
