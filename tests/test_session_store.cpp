#include "session/session_store.hpp"
#include "utils/utils.hpp"
#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

SessionRecord sample_record() {
  SessionRecord record;
  record.task = "Finish the linear algebra problem set";
  record.start_time_ms = 1'700'000'000'000ULL;
  record.end_time_ms = 1'700'007'200'000ULL;
  record.duration_hours = 2.0;
  record.proxy_port = 8080;
  record.secret_hash = std::string(64, 'a');
  return record;
}

} // namespace

class SessionStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = (std::filesystem::temp_directory_path() /
             ("anchorite_session_store_" +
              std::to_string(reinterpret_cast<uintptr_t>(this)) + ".json"))
                .string();
    std::filesystem::remove(path_);
  }
  void TearDown() override { std::filesystem::remove(path_); }

  std::string path_;
};

TEST_F(SessionStoreTest, SaveThenLoad) {
  SessionStore store(path_);
  EXPECT_FALSE(store.exists());
  EXPECT_FALSE(store.load().has_value());

  ASSERT_TRUE(store.save(sample_record()));
  EXPECT_TRUE(store.exists());

  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->task, "Finish the linear algebra problem set");
  EXPECT_EQ(loaded->end_time_ms - loaded->start_time_ms, 7'200'000ULL);
  EXPECT_DOUBLE_EQ(loaded->duration_hours, 2.0);
  EXPECT_EQ(loaded->proxy_port, 8080);
  EXPECT_EQ(loaded->secret_hash, std::string(64, 'a'));
}

TEST_F(SessionStoreTest, SaveReplacesPreviousRecord) {
  SessionStore store(path_);
  ASSERT_TRUE(store.save(sample_record()));
  SessionRecord second = sample_record();
  second.task = "Write the report";
  ASSERT_TRUE(store.save(second));
  EXPECT_EQ(store.load()->task, "Write the report");
}

TEST_F(SessionStoreTest, ClearRemovesRecord) {
  SessionStore store(path_);
  ASSERT_TRUE(store.save(sample_record()));
  EXPECT_TRUE(store.clear());
  EXPECT_FALSE(store.exists());
  // Clearing an absent record is not an error
  EXPECT_TRUE(store.clear());
}

TEST_F(SessionStoreTest, CorruptRecordLoadsAsEmpty) {
  ASSERT_TRUE(Utils::write_file_atomically(path_, "{ not json"));
  SessionStore store(path_);
  EXPECT_FALSE(store.load().has_value());

  ASSERT_TRUE(Utils::write_file_atomically(path_, R"({"task": "x"})"));
  EXPECT_FALSE(store.load().has_value());
}

TEST(SessionRecordJsonTest, RejectsUnknownVersion) {
  nlohmann::json j = session_record_to_json(sample_record());
  EXPECT_EQ(j["format_version"], SessionRecord::FORMAT_VERSION);
  EXPECT_FALSE(j.contains("secret"));

  j["format_version"] = SessionRecord::FORMAT_VERSION + 1;
  EXPECT_THROW(session_record_from_json(j), std::runtime_error);
}

TEST(SessionRecordJsonTest, RejectsMistypedFields) {
  nlohmann::json j = session_record_to_json(sample_record());
  j["proxy_port"] = "8080";
  EXPECT_ANY_THROW(session_record_from_json(j));
}
