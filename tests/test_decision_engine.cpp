#include "detection/decision_engine.hpp"
#include "io/db/in_memory_decision_store.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <stdexcept>

namespace {

class FixedModel : public IAdmissionModel {
public:
  explicit FixedModel(double p, bool fail = false) : p_(p), fail_(fail) {}

  double predict_probability(const std::vector<double> &features) override {
    if (fail_)
      throw std::runtime_error("inference backend crashed");
    last_input_size = features.size();
    return p_;
  }
  size_t input_size() const override { return FeatureLayout::FEATURE_COUNT; }
  std::string kind() const override { return "fixed"; }

  size_t last_input_size = 0;

private:
  double p_;
  bool fail_;
};

class StaticFetcher : public IMetadataFetcher {
public:
  explicit StaticFetcher(std::string video_title)
      : video_title_(std::move(video_title)) {}
  PageMetadata fetch(const std::string &url) override {
    PageMetadata metadata = PageMetadata::basic(url);
    metadata.video_title = video_title_;
    return metadata;
  }

private:
  std::string video_title_;
};

class CountingFetcher : public IMetadataFetcher {
public:
  PageMetadata fetch(const std::string &url) override {
    ++calls;
    PageMetadata metadata = PageMetadata::basic(url);
    metadata.title = "Fetched page";
    return metadata;
  }

  std::atomic<int> calls{0};
};

} // namespace

class DecisionEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir =
        std::filesystem::temp_directory_path() / "anchorite_engine_test";
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);
    config.stats_snapshot_path = (test_dir / "stats.json").string();
    config.classifier.decision_threshold = 0.5;
  }

  void TearDown() override { std::filesystem::remove_all(test_dir); }

  std::unique_ptr<DecisionEngine>
  make_engine(std::shared_ptr<IAdmissionModel> model,
              BoundedMetadataSource *source = nullptr) {
    models = std::make_unique<ModelManager>(config.classifier, std::move(model));
    return std::make_unique<DecisionEngine>(config, *models, store, metrics,
                                            source);
  }

  static PageMetadata unknown_page(const std::string &url) {
    PageMetadata metadata = PageMetadata::basic(url);
    metadata.title = "Some article";
    metadata.description = "Words about things";
    return metadata;
  }

  std::filesystem::path test_dir;
  Config::AppConfig config;
  MetricsRegistry metrics;
  InMemoryDecisionStore store;
  std::unique_ptr<ModelManager> models;
};

TEST_F(DecisionEngineTest, FastPathUsesRulesThenCache) {
  auto engine = make_engine(std::make_shared<FixedModel>(0.9));

  auto first = engine->decide("https://github.com/org/repo");
  EXPECT_TRUE(first.allowed());
  EXPECT_EQ(first.source, VerdictSource::RULE_TIER);
  EXPECT_DOUBLE_EQ(first.confidence, 1.0);

  auto second = engine->decide("https://github.com/org/repo");
  EXPECT_EQ(second.source, VerdictSource::CACHE);
  EXPECT_EQ(second.action, first.action);

  auto stats = engine->statistics().counters;
  EXPECT_EQ(stats.total_decisions, 1u);
  EXPECT_EQ(stats.fast_path_decisions, 1u);
  EXPECT_EQ(stats.cache_hits, 1u);
  EXPECT_EQ(engine->cache_size(), 1u);
}

TEST_F(DecisionEngineTest, FastPathBlocksDistractions) {
  auto engine = make_engine(std::make_shared<FixedModel>(0.9));
  auto verdict = engine->decide("https://www.youtube.com/shorts/xyz");
  EXPECT_FALSE(verdict.allowed());
  EXPECT_EQ(verdict.source, VerdictSource::RULE_TIER);
  // The fast path never records training data
  EXPECT_EQ(store.size(), 0u);
}

TEST_F(DecisionEngineTest, ClassifierAllowsAboveThreshold) {
  auto model = std::make_shared<FixedModel>(0.9);
  auto engine = make_engine(model);
  engine->set_mission(Mission::from_text("Learn rust"));

  auto verdict = engine->decide_with_metadata(unknown_page("https://blog.example/post"));
  EXPECT_TRUE(verdict.allowed());
  EXPECT_EQ(verdict.source, VerdictSource::CLASSIFIER);
  EXPECT_DOUBLE_EQ(verdict.confidence, 0.9);
  EXPECT_EQ(model->last_input_size, FeatureLayout::FEATURE_COUNT);

  auto recorded = store.recent(1);
  ASSERT_EQ(recorded.size(), 1u);
  EXPECT_EQ(recorded[0].mission, "Learn rust");
  EXPECT_EQ(recorded[0].features.size(), FeatureLayout::FEATURE_COUNT);
  EXPECT_EQ(recorded[0].action, AdmissionAction::ALLOW);
}

TEST_F(DecisionEngineTest, ThresholdTieBlocks) {
  auto engine = make_engine(std::make_shared<FixedModel>(0.5));
  engine->set_mission(Mission::from_text("Learn rust"));

  auto verdict = engine->decide_with_metadata(unknown_page("https://blog.example/post"));
  EXPECT_FALSE(verdict.allowed());
  EXPECT_EQ(verdict.source, VerdictSource::CLASSIFIER);

  auto cached = engine->decide_with_metadata(unknown_page("https://blog.example/post"));
  EXPECT_EQ(cached.source, VerdictSource::CACHE);
  EXPECT_FALSE(cached.allowed());
  EXPECT_EQ(store.size(), 1u);
}

TEST_F(DecisionEngineTest, SlowPathRuleTierShortCircuits) {
  auto engine = make_engine(std::make_shared<FixedModel>(0.9));
  engine->set_mission(Mission::from_text("Learn logistic regression"));

  PageMetadata video = PageMetadata::basic("https://www.youtube.com/watch?v=1");
  video.video_title = "Funniest cat compilation";
  auto verdict = engine->decide_with_metadata(video);
  EXPECT_FALSE(verdict.allowed());
  EXPECT_EQ(verdict.source, VerdictSource::RULE_TIER);
  EXPECT_EQ(store.size(), 0u);

  PageMetadata aligned = PageMetadata::basic("https://www.youtube.com/watch?v=2");
  aligned.video_title = "Logistic regression explained";
  EXPECT_TRUE(engine->decide_with_metadata(aligned).allowed());
}

TEST_F(DecisionEngineTest, NoMissionAllowsWithoutCaching) {
  auto engine = make_engine(std::make_shared<FixedModel>(0.1));
  auto verdict = engine->decide_with_metadata(unknown_page("https://blog.example/a"));
  EXPECT_TRUE(verdict.allowed());
  EXPECT_EQ(verdict.source, VerdictSource::FAIL_OPEN);
  EXPECT_EQ(engine->cache_size(), 0u);
  EXPECT_EQ(store.size(), 0u);
}

TEST_F(DecisionEngineTest, ModelFailureFailsOpen) {
  auto engine = make_engine(std::make_shared<FixedModel>(0.1, true));
  engine->set_mission(Mission::from_text("Learn rust"));

  auto verdict = engine->decide_with_metadata(unknown_page("https://blog.example/a"));
  EXPECT_TRUE(verdict.allowed());
  EXPECT_EQ(verdict.source, VerdictSource::FAIL_OPEN);
  EXPECT_DOUBLE_EQ(verdict.confidence, 0.0);
  EXPECT_EQ(verdict.reason, "internal error");
  EXPECT_EQ(engine->statistics().counters.total_decisions, 1u);
}

TEST_F(DecisionEngineTest, DisabledClassifierFallsBackToRules) {
  config.classifier.enabled = false;
  models = std::make_unique<ModelManager>(config.classifier);
  DecisionEngine engine(config, *models, store, metrics);
  engine.set_mission(Mission::from_text("Learn rust"));

  auto verdict = engine.decide_with_metadata(unknown_page("https://blog.example/a"));
  EXPECT_TRUE(verdict.allowed());
  EXPECT_EQ(verdict.source, VerdictSource::RULE_TIER);
  EXPECT_EQ(verdict.reason, "classifier disabled");
  EXPECT_EQ(engine.statistics().model_kind, "disabled");
}

TEST_F(DecisionEngineTest, UrlOnlyMetadataIsEnriched) {
  auto fetcher = std::make_shared<StaticFetcher>("Top 10 cat fails");
  Config::MetadataFetchConfig fetch_cfg;
  fetch_cfg.worker_count = 1;
  fetch_cfg.wait_timeout_ms = 2000;
  BoundedMetadataSource source(fetcher, fetch_cfg);

  auto engine = make_engine(std::make_shared<FixedModel>(0.9), &source);
  engine->set_mission(Mission::from_text("Learn logistic regression"));

  auto verdict = engine->decide_with_metadata(
      PageMetadata::basic("https://www.youtube.com/watch?v=9"));
  EXPECT_FALSE(verdict.allowed());
  EXPECT_EQ(verdict.source, VerdictSource::RULE_TIER);
  EXPECT_EQ(source.counters().completed, 1u);
}

TEST_F(DecisionEngineTest, FetchOnlyWhenPageTextCanChangeTheVerdict) {
  auto fetcher = std::make_shared<CountingFetcher>();
  Config::MetadataFetchConfig fetch_cfg;
  fetch_cfg.worker_count = 1;
  fetch_cfg.wait_timeout_ms = 2000;
  BoundedMetadataSource source(fetcher, fetch_cfg);

  auto engine = make_engine(std::make_shared<FixedModel>(0.9), &source);
  engine->set_mission(Mission::from_text("Learn rust"));

  // Decided by the educational tier without page text
  engine->decide_with_metadata(PageMetadata::basic("https://github.com/x"));
  auto again =
      engine->decide_with_metadata(PageMetadata::basic("https://github.com/x"));
  EXPECT_TRUE(again.allowed());
  EXPECT_EQ(fetcher->calls.load(), 0);
  EXPECT_EQ(source.counters().completed, 0u);

  // Unknown URL: fetched once for the classifier, then served from cache
  auto first = engine->decide_with_metadata(
      PageMetadata::basic("https://blog.example/post"));
  EXPECT_EQ(first.source, VerdictSource::CLASSIFIER);
  auto second = engine->decide_with_metadata(
      PageMetadata::basic("https://blog.example/post"));
  EXPECT_EQ(second.source, VerdictSource::CACHE);
  EXPECT_EQ(fetcher->calls.load(), 1);
  EXPECT_EQ(source.counters().completed, 1u);
}

TEST_F(DecisionEngineTest, NoMissionSkipsFetch) {
  auto fetcher = std::make_shared<CountingFetcher>();
  Config::MetadataFetchConfig fetch_cfg;
  fetch_cfg.worker_count = 1;
  BoundedMetadataSource source(fetcher, fetch_cfg);

  auto engine = make_engine(std::make_shared<FixedModel>(0.9), &source);
  auto verdict = engine->decide_with_metadata(
      PageMetadata::basic("https://blog.example/post"));
  EXPECT_EQ(verdict.source, VerdictSource::FAIL_OPEN);
  engine->decide_with_metadata(
      PageMetadata::basic("https://www.youtube.com/watch?v=3"));
  EXPECT_EQ(fetcher->calls.load(), 0);
}

TEST_F(DecisionEngineTest, FeedbackUpdatesCountersAndFlushes) {
  config.statistics.flush_every_feedback = 1;
  auto engine = make_engine(std::make_shared<FixedModel>(0.8));
  engine->set_mission(Mission::from_text("Learn rust"));
  engine->decide_with_metadata(unknown_page("https://blog.example/a"));

  EXPECT_TRUE(engine->submit_feedback("https://blog.example/a", false));
  EXPECT_FALSE(engine->submit_feedback("https://blog.example/a", true));
  EXPECT_FALSE(engine->submit_feedback("https://never-seen.example", true));

  auto stats = engine->statistics().counters;
  EXPECT_EQ(stats.user_feedback_count, 1u);
  EXPECT_EQ(stats.correct_decisions, 0u);
  EXPECT_DOUBLE_EQ(stats.average_reward(), -1.0);

  auto stored = store.recent(1);
  ASSERT_EQ(stored.size(), 1u);
  ASSERT_TRUE(stored[0].reward.has_value());
  EXPECT_DOUBLE_EQ(*stored[0].reward, -1.0);

  ASSERT_TRUE(std::filesystem::exists(config.stats_snapshot_path));
  auto snapshot = load_statistics_snapshot(config.stats_snapshot_path);
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_EQ(snapshot->user_feedback_count, 1u);
}

TEST_F(DecisionEngineTest, FeedbackIsScopedToCurrentMission) {
  auto engine = make_engine(std::make_shared<FixedModel>(0.8));
  engine->set_mission(Mission::from_text("Learn rust"));
  engine->decide_with_metadata(unknown_page("https://blog.example/a"));

  engine->set_mission(Mission::from_text("Write thesis"));
  EXPECT_FALSE(engine->submit_feedback("https://blog.example/a", true));
}

TEST_F(DecisionEngineTest, StatisticsSurviveRestart) {
  {
    auto engine = make_engine(std::make_shared<FixedModel>(0.8));
    engine->decide("https://github.com/a");
    engine->decide("https://github.com/a");
  }
  MetricsRegistry fresh_metrics;
  ModelManager fresh_models(config.classifier,
                            std::make_shared<FixedModel>(0.8));
  DecisionEngine restarted(config, fresh_models, store, fresh_metrics);
  auto stats = restarted.statistics().counters;
  EXPECT_EQ(stats.total_decisions, 1u);
  EXPECT_EQ(stats.cache_hits, 1u);
}

TEST_F(DecisionEngineTest, RecentVerdictsNewestFirst) {
  auto engine = make_engine(std::make_shared<FixedModel>(0.8));
  engine->decide("https://github.com/a");
  engine->decide("https://reddit.com/r/x");

  auto recent = engine->recent_verdicts(10);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].url, "https://reddit.com/r/x");
  EXPECT_FALSE(recent[0].verdict.allowed());
  EXPECT_EQ(engine->recent_verdicts(1).size(), 1u);
}

TEST_F(DecisionEngineTest, ClearCacheAndMission) {
  auto engine = make_engine(std::make_shared<FixedModel>(0.8));
  engine->set_mission(Mission::from_text("Learn rust"));
  engine->decide("https://github.com/a");
  EXPECT_EQ(engine->cache_size(), 1u);

  engine->clear_cache();
  EXPECT_EQ(engine->cache_size(), 0u);

  engine->clear_mission();
  EXPECT_EQ(engine->mission(), nullptr);
}

TEST_F(DecisionEngineTest, StatisticsJsonIncludesRates) {
  auto engine = make_engine(std::make_shared<FixedModel>(0.8));
  engine->decide("https://github.com/a");
  engine->decide("https://github.com/a");

  auto j = engine_statistics_to_json(engine->statistics());
  EXPECT_DOUBLE_EQ(j["cache_hit_rate"].get<double>(), 0.5);
  EXPECT_DOUBLE_EQ(j["fast_path_rate"].get<double>(), 1.0);
  EXPECT_EQ(j["model_kind"], "fixed");
  EXPECT_EQ(j["cache_entries"], 1);
}

TEST_F(DecisionEngineTest, MetricsExposeVerdictSources) {
  auto engine = make_engine(std::make_shared<FixedModel>(0.9));
  engine->decide("https://github.com/org/repo");
  engine->decide("https://github.com/org/repo");

  const std::string exposition = metrics.serialize();
  EXPECT_NE(exposition.find("anchorite_decisions_total{source=\"RULE_TIER\"} 1"),
            std::string::npos);
  EXPECT_NE(exposition.find("anchorite_decisions_total{source=\"CACHE\"} 1"),
            std::string::npos);
  EXPECT_NE(exposition.find("anchorite_decision_latency_seconds_count{path=\"fast\"} 2"),
            std::string::npos);
}
