#include "io/db/in_memory_decision_store.hpp"
#include <gtest/gtest.h>

namespace {

Decision make_decision(const std::string &url, const std::string &mission,
                       uint64_t ts) {
  Decision d;
  d.url = url;
  d.mission = mission;
  d.features = std::vector<double>(4, 0.25);
  d.action = AdmissionAction::BLOCK;
  d.confidence = 0.3;
  d.timestamp_ms = ts;
  return d;
}

} // namespace

class InMemoryDecisionStoreTest : public ::testing::Test {
protected:
  InMemoryDecisionStore store;
};

TEST_F(InMemoryDecisionStoreTest, AppendAssignsSequentialIds) {
  ASSERT_TRUE(store.append(make_decision("u1", "m", 1)));
  ASSERT_TRUE(store.append(make_decision("u2", "m", 2)));
  EXPECT_EQ(store.size(), 2u);

  auto recent = store.recent(10);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].id, "2");
  EXPECT_EQ(recent[0].url, "u2");
  EXPECT_EQ(recent[1].id, "1");
}

TEST_F(InMemoryDecisionStoreTest, RecentRespectsLimit) {
  for (int i = 0; i < 5; ++i)
    store.append(make_decision("u" + std::to_string(i), "m", i));
  auto recent = store.recent(2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].url, "u4");
  EXPECT_TRUE(store.recent(0).empty());
}

TEST_F(InMemoryDecisionStoreTest, FeedbackTargetsNewestUnlabelledMatch) {
  store.append(make_decision("u", "m", 1));
  store.append(make_decision("u", "m", 2));
  store.append(make_decision("u", "other mission", 3));

  auto first = store.attach_feedback("u", "m", true);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->timestamp_ms, 2u);
  ASSERT_TRUE(first->feedback.has_value());
  EXPECT_TRUE(*first->feedback);
  EXPECT_DOUBLE_EQ(*first->reward, 1.0);

  auto second = store.attach_feedback("u", "m", false);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->timestamp_ms, 1u);
  EXPECT_DOUBLE_EQ(*second->reward, -1.0);

  // Each decision takes feedback at most once
  EXPECT_FALSE(store.attach_feedback("u", "m", true).has_value());
}

TEST_F(InMemoryDecisionStoreTest, FeedbackWithoutMatchingDecision) {
  store.append(make_decision("u", "m", 1));
  EXPECT_FALSE(store.attach_feedback("other", "m", true).has_value());
  EXPECT_FALSE(store.attach_feedback("u", "different", true).has_value());
}

TEST(InMemoryDecisionStoreCapacityTest, OldestDecisionIsDropped) {
  InMemoryDecisionStore store(3);
  EXPECT_EQ(store.capacity(), 3u);
  for (int i = 1; i <= 5; ++i)
    ASSERT_TRUE(store.append(make_decision("u", "m", i)));
  EXPECT_EQ(store.size(), 3u);

  auto recent = store.recent(10);
  ASSERT_EQ(recent.size(), 3u);
  EXPECT_EQ(recent.front().timestamp_ms, 5u);
  EXPECT_EQ(recent.back().timestamp_ms, 3u);
  // Ids keep counting across evictions
  EXPECT_EQ(recent.front().id, "5");

  auto updated = store.attach_feedback("u", "m", true);
  ASSERT_TRUE(updated.has_value());
  EXPECT_EQ(updated->timestamp_ms, 5u);
}

TEST(InMemoryDecisionStoreCapacityTest, EvictedDecisionTakesNoFeedback) {
  InMemoryDecisionStore store(2);
  store.append(make_decision("old", "m", 1));
  store.append(make_decision("a", "m", 2));
  store.append(make_decision("b", "m", 3));
  EXPECT_FALSE(store.attach_feedback("old", "m", true).has_value());
  EXPECT_TRUE(store.attach_feedback("a", "m", true).has_value());
}

TEST(DecisionStoreJsonTest, ReportsFeatureCountNotVector) {
  Decision d = make_decision("https://a.com", "learn", 42);
  d.id = "7";
  auto j = decision_to_json(d);
  EXPECT_EQ(j["id"], "7");
  EXPECT_EQ(j["url"], "https://a.com");
  EXPECT_EQ(j["action"], "BLOCK");
  EXPECT_EQ(j["feature_count"], 4);
  EXPECT_FALSE(j.contains("features"));
}
