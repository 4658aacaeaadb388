#include "utils/json_formatter.hpp"
#include <gtest/gtest.h>

TEST(JsonFormatterTest, VerdictFields) {
  Verdict verdict;
  verdict.action = AdmissionAction::BLOCK;
  verdict.confidence = 0.25;
  verdict.source = VerdictSource::CLASSIFIER;
  verdict.reason = "classifier probability 0.25";

  nlohmann::json j = JsonFormatter::verdict_to_json(verdict);
  EXPECT_FALSE(j["allowed"].get<bool>());
  EXPECT_EQ(j["action"], "BLOCK");
  EXPECT_DOUBLE_EQ(j["confidence"].get<double>(), 0.25);
  EXPECT_EQ(j["source"], "CLASSIFIER");
  EXPECT_EQ(j["reason"], "classifier probability 0.25");
}

TEST(JsonFormatterTest, LogEntryAddsUrlAndTimestamp) {
  VerdictLogEntry entry;
  entry.url = "https://example.com";
  entry.verdict.source = VerdictSource::FAIL_OPEN;
  entry.timestamp_ms = 42;

  nlohmann::json j = JsonFormatter::verdict_log_entry_to_json(entry);
  EXPECT_TRUE(j["allowed"].get<bool>());
  EXPECT_EQ(j["source"], "FAIL_OPEN");
  EXPECT_EQ(j["url"], "https://example.com");
  EXPECT_EQ(j["timestamp_ms"].get<uint64_t>(), 42u);
}
