#include "io/metadata/bounded_metadata_source.hpp"
#include "core/logger.hpp"

#include <chrono>

BoundedMetadataSource::BoundedMetadataSource(
    std::shared_ptr<IMetadataFetcher> fetcher,
    const Config::MetadataFetchConfig &config)
    : fetcher_(std::move(fetcher)), config_(config),
      pending_(config.max_pending) {
  for (uint32_t i = 0; i < config_.worker_count; ++i)
    workers_.emplace_back(&BoundedMetadataSource::worker_loop, this);
  LOG(LogLevel::INFO, LogComponent::IO_FETCH,
      "Metadata source started with "
          << workers_.size() << " workers, " << config_.max_pending
          << " pending slots and a " << config_.wait_timeout_ms
          << "ms wait bound.");
}

BoundedMetadataSource::~BoundedMetadataSource() {
  stopping_ = true;
  pending_.shutdown();
  for (auto &worker : workers_)
    if (worker.joinable())
      worker.join();
  LOG(LogLevel::DEBUG, LogComponent::IO_FETCH, "Metadata source stopped.");
}

PageMetadata BoundedMetadataSource::fetch(const std::string &url) {
  auto task = std::make_shared<FetchTask>();
  task->url = url;
  std::future<PageMetadata> result = task->result.get_future();

  if (!pending_.try_push(task)) {
    ++overflows_;
    LOG(LogLevel::WARN, LogComponent::IO_FETCH,
        "Fetch queue full, using basic metadata for " << url);
    return PageMetadata::basic(url);
  }

  if (result.wait_for(std::chrono::milliseconds(config_.wait_timeout_ms)) !=
      std::future_status::ready) {
    // The worker finishes on its own; its result is dropped with the promise
    ++timeouts_;
    LOG(LogLevel::WARN, LogComponent::IO_FETCH,
        "Fetch of " << url << " exceeded " << config_.wait_timeout_ms
                    << "ms, using basic metadata.");
    return PageMetadata::basic(url);
  }

  try {
    PageMetadata metadata = result.get();
    ++completed_;
    return metadata;
  } catch (const std::exception &e) {
    ++failures_;
    LOG(LogLevel::WARN, LogComponent::IO_FETCH,
        "Fetch of " << url << " failed: " << e.what()
                    << ". Using basic metadata.");
    return PageMetadata::basic(url);
  }
}

void BoundedMetadataSource::worker_loop() {
  std::shared_ptr<FetchTask> task;
  while (pending_.wait_and_pop(task)) {
    if (stopping_) {
      task->result.set_value(PageMetadata::basic(task->url));
      continue;
    }
    try {
      task->result.set_value(fetcher_->fetch(task->url));
    } catch (const std::exception &) {
      task->result.set_exception(std::current_exception());
    }
  }
}

BoundedMetadataSource::Counters BoundedMetadataSource::counters() const {
  Counters c;
  c.completed = completed_.load();
  c.timeouts = timeouts_.load();
  c.overflows = overflows_.load();
  c.failures = failures_.load();
  return c;
}
