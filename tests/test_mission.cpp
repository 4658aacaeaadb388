#include "core/mission.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace {

bool has_keyword(const Mission &mission, const std::string &keyword) {
  return std::find(mission.keywords.begin(), mission.keywords.end(),
                   keyword) != mission.keywords.end();
}

} // namespace

TEST(MissionTest, DerivesKeywordsAndBigrams) {
  auto keywords = derive_mission_keywords("Learn Logistic Regression, in Python!");
  // "in" is a stop word and too short; punctuation is trimmed
  ASSERT_GE(keywords.size(), 4u);
  EXPECT_EQ(keywords[0], "learn");
  EXPECT_EQ(keywords[1], "logistic");
  EXPECT_EQ(keywords[2], "regression");
  EXPECT_EQ(keywords[3], "python");
  EXPECT_NE(std::find(keywords.begin(), keywords.end(), "logistic regression"),
            keywords.end());
}

TEST(MissionTest, KeywordsAreCappedAndDeduplicated) {
  std::string text;
  for (int i = 0; i < 30; ++i)
    text += "word" + std::to_string(i) + " ";
  EXPECT_EQ(derive_mission_keywords(text).size(), 20u);

  auto repeated = derive_mission_keywords("rust rust rust");
  EXPECT_EQ(std::count(repeated.begin(), repeated.end(), "rust"), 1);
}

TEST(MissionTest, CreateNormalisesDomainsAndKeywords) {
  auto mission = Mission::create("  Study compilers  ",
                                 {"https://www.LLVM.org/docs", "  ", "gcc.gnu.org"},
                                 {" Parsing "});
  EXPECT_EQ(mission.text, "Study compilers");
  ASSERT_EQ(mission.allowed_domains.size(), 2u);
  EXPECT_EQ(mission.allowed_domains[0], "llvm.org");
  EXPECT_EQ(mission.allowed_domains[1], "gcc.gnu.org");
  ASSERT_EQ(mission.allowed_keywords.size(), 1u);
  EXPECT_TRUE(has_keyword(mission, "parsing"));
  EXPECT_TRUE(has_keyword(mission, "compilers"));
}

TEST(MissionTest, MatchesTextCaseInsensitively) {
  auto mission = Mission::from_text("logistic regression");
  EXPECT_TRUE(mission.matches_text("Intro to LOGISTIC models"));
  EXPECT_FALSE(mission.matches_text("Cat compilation"));
  EXPECT_FALSE(mission.matches_text(""));
}

TEST(MissionTest, FromJsonAcceptsBothSpellings) {
  auto modern = mission_from_json(
      {{"missionText", "Learn Rust"}, {"allowedDomains", {"doc.rust-lang.org"}}});
  ASSERT_TRUE(modern.has_value());
  EXPECT_EQ(modern->allowed_domains[0], "doc.rust-lang.org");

  auto legacy = mission_from_json(
      {{"mission", "Learn Go"}, {"allowed_keywords", {"goroutine"}}});
  ASSERT_TRUE(legacy.has_value());
  EXPECT_TRUE(has_keyword(*legacy, "goroutine"));

  EXPECT_FALSE(mission_from_json({{"missionText", "   "}}).has_value());
  EXPECT_FALSE(mission_from_json(nlohmann::json::array()).has_value());
}

TEST(MissionTest, LoadMissionFile) {
  auto dir = std::filesystem::temp_directory_path() / "anchorite_mission_test";
  std::filesystem::create_directories(dir);
  auto path = (dir / "mission.json").string();

  EXPECT_FALSE(load_mission_file(path).has_value());

  {
    std::ofstream out(path);
    out << "{not json";
  }
  EXPECT_FALSE(load_mission_file(path).has_value());

  {
    std::ofstream out(path);
    out << mission_to_json(Mission::from_text("Write the thesis")).dump();
  }
  auto loaded = load_mission_file(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->text, "Write the thesis");

  std::filesystem::remove_all(dir);
}
