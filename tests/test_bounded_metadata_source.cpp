#include "io/metadata/bounded_metadata_source.hpp"
#include <gtest/gtest.h>

#include <condition_variable>
#include <mutex>
#include <stdexcept>

namespace {

// Blocks every fetch until open() is called
class GatedFetcher : public IMetadataFetcher {
public:
  PageMetadata fetch(const std::string &url) override {
    std::unique_lock<std::mutex> lock(mutex_);
    ++started_;
    cv_.wait(lock, [this] { return open_; });
    PageMetadata metadata = PageMetadata::basic(url);
    metadata.title = "fetched";
    return metadata;
  }

  void open() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  int started() {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_ = false;
  int started_ = 0;
};

class ThrowingFetcher : public IMetadataFetcher {
public:
  PageMetadata fetch(const std::string &) override {
    throw std::runtime_error("connection refused");
  }
};

Config::MetadataFetchConfig small_config(uint32_t workers, size_t pending,
                                         uint32_t wait_ms) {
  Config::MetadataFetchConfig cfg;
  cfg.enabled = true;
  cfg.worker_count = workers;
  cfg.max_pending = pending;
  cfg.wait_timeout_ms = wait_ms;
  return cfg;
}

} // namespace

TEST(BoundedMetadataSourceTest, ReturnsFetchedMetadata) {
  auto fetcher = std::make_shared<GatedFetcher>();
  fetcher->open();
  BoundedMetadataSource source(fetcher, small_config(2, 4, 2000));
  EXPECT_EQ(source.worker_count(), 2u);

  auto metadata = source.fetch("https://example.com/page");
  EXPECT_EQ(metadata.title, "fetched");
  EXPECT_EQ(metadata.domain, "example.com");
  EXPECT_EQ(source.counters().completed, 1u);
}

TEST(BoundedMetadataSourceTest, DeadlineYieldsBasicMetadata) {
  auto fetcher = std::make_shared<GatedFetcher>();
  BoundedMetadataSource source(fetcher, small_config(1, 4, 50));

  auto metadata = source.fetch("https://slow.example/a");
  EXPECT_TRUE(metadata.title.empty());
  EXPECT_EQ(metadata.domain, "slow.example");
  EXPECT_EQ(source.counters().timeouts, 1u);

  fetcher->open();
}

TEST(BoundedMetadataSourceTest, FullQueueOverflowsImmediately) {
  auto fetcher = std::make_shared<GatedFetcher>();
  BoundedMetadataSource source(fetcher, small_config(1, 1, 50));

  // First request occupies the only worker, second fills the queue
  source.fetch("https://a.example/1");
  source.fetch("https://a.example/2");
  auto third = source.fetch("https://a.example/3");

  EXPECT_EQ(third.path, "/3");
  auto counters = source.counters();
  EXPECT_EQ(counters.timeouts, 2u);
  EXPECT_EQ(counters.overflows, 1u);
  // Only one fetch ran concurrently
  EXPECT_EQ(fetcher->started(), 1);

  fetcher->open();
}

TEST(BoundedMetadataSourceTest, FetcherErrorsAreAbsorbed) {
  BoundedMetadataSource source(std::make_shared<ThrowingFetcher>(),
                               small_config(1, 2, 2000));
  auto metadata = source.fetch("https://down.example/");
  EXPECT_EQ(metadata.domain, "down.example");
  EXPECT_EQ(source.counters().failures, 1u);
}
