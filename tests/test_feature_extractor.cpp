#include "models/feature_extractor.hpp"
#include <gtest/gtest.h>

class FeatureExtractorTest : public ::testing::Test {
protected:
  FeatureExtractor extractor;
  TimeContext weekday_morning{10, 1};
};

TEST_F(FeatureExtractorTest, VectorHasFixedLength) {
  EXPECT_EQ(extractor.extract("", "", weekday_morning).size(),
            FeatureLayout::FEATURE_COUNT);
  EXPECT_EQ(extractor.extract("::::not a url", "", weekday_morning).size(),
            FeatureLayout::FEATURE_COUNT);

  PageMetadata rich = PageMetadata::basic("https://example.com/a");
  rich.title = "Some title";
  rich.keywords = {"a", "b"};
  EXPECT_EQ(extractor.extract(rich, "learn things", weekday_morning).size(),
            FeatureLayout::FEATURE_COUNT);
}

TEST_F(FeatureExtractorTest, ExtractionIsDeterministic) {
  auto a = extractor.extract("https://github.com/org/repo?tab=readme",
                             "learn rust", weekday_morning);
  auto b = extractor.extract("https://github.com/org/repo?tab=readme",
                             "learn rust", weekday_morning);
  EXPECT_EQ(a, b);

  EXPECT_DOUBLE_EQ(FeatureExtractor::hash_feature("url_0_github"),
                   FeatureExtractor::hash_feature("url_0_github"));
  double h = FeatureExtractor::hash_feature("anything");
  EXPECT_GE(h, 0.0);
  EXPECT_LT(h, 1.0);
}

TEST_F(FeatureExtractorTest, StructuralFeatures) {
  auto v = extractor.extract(
      "https://docs.example.edu/search/results?q=test&page=2", "",
      weekday_morning);
  EXPECT_EQ(v[feature_index(StructuralFeature::DOMAIN_DEPTH)], 3.0);
  EXPECT_EQ(v[feature_index(StructuralFeature::IS_EDU_DOMAIN)], 1.0);
  EXPECT_EQ(v[feature_index(StructuralFeature::IS_DOCS_HOST)], 1.0);
  EXPECT_EQ(v[feature_index(StructuralFeature::IS_SEARCH_PATH)], 1.0);
  EXPECT_EQ(v[feature_index(StructuralFeature::QUERY_PARAM_COUNT)], 2.0);
  EXPECT_EQ(v[feature_index(StructuralFeature::HAS_SEARCH_QUERY)], 1.0);
  EXPECT_EQ(v[feature_index(StructuralFeature::AMPERSAND_COUNT)], 1.0);
  EXPECT_EQ(v[feature_index(StructuralFeature::IS_HTTPS)], 1.0);
  EXPECT_EQ(v[feature_index(StructuralFeature::IS_VIDEO_PATH)], 0.0);
}

TEST_F(FeatureExtractorTest, ContentFeatures) {
  PageMetadata metadata = PageMetadata::basic("https://youtube.com/watch?v=x");
  metadata.video_title = "Logistic Regression tutorial in Python";
  metadata.educational_indicators = 4;
  metadata.entertainment_indicators = 0;
  metadata.has_video = true;

  auto v = extractor.extract(metadata, "", weekday_morning);
  EXPECT_EQ(v[feature_index(ContentFeature::HAS_VIDEO_TITLE)], 1.0);
  EXPECT_EQ(v[feature_index(ContentFeature::HAS_TITLE)], 0.0);
  EXPECT_DOUBLE_EQ(v[feature_index(ContentFeature::EDUCATIONAL_INDICATORS_NORM)],
                   0.4);
  // No entertainment indicators: ratio is a presence flag
  EXPECT_EQ(v[feature_index(ContentFeature::EDU_ENT_RATIO)], 1.0);
  // logistic regression, python, tutorial
  EXPECT_DOUBLE_EQ(
      v[feature_index(ContentFeature::VIDEO_TITLE_TOPIC_ALIGNMENT)], 1.0);
  EXPECT_EQ(v[feature_index(ContentFeature::HAS_VIDEO)], 1.0);
}

TEST_F(FeatureExtractorTest, TemporalFeatures) {
  auto weekend_night = extractor.extract("https://a.com", "", TimeContext{23, 6});
  EXPECT_DOUBLE_EQ(weekend_night[feature_index(TemporalFeature::HOUR_NORM)], 1.0);
  EXPECT_DOUBLE_EQ(weekend_night[feature_index(TemporalFeature::WEEKDAY_NORM)],
                   1.0);
  EXPECT_EQ(weekend_night[feature_index(TemporalFeature::IS_WORKING_HOURS)], 0.0);
  EXPECT_EQ(weekend_night[feature_index(TemporalFeature::IS_WEEKEND)], 1.0);

  auto working = extractor.extract("https://a.com", "", weekday_morning);
  EXPECT_EQ(working[feature_index(TemporalFeature::IS_WORKING_HOURS)], 1.0);
  EXPECT_EQ(working[feature_index(TemporalFeature::IS_WEEKEND)], 0.0);
}

TEST_F(FeatureExtractorTest, ContentTextFallsBackToUrl) {
  auto text = FeatureExtractor::compose_content_text(
      PageMetadata::basic("https://example.com/some-page"), "");
  EXPECT_EQ(text, "Website: example.com some page");
}

TEST_F(FeatureExtractorTest, ContentTextPrefersVideoFields) {
  PageMetadata metadata = PageMetadata::basic("https://youtube.com/watch?v=x");
  metadata.title = "YouTube";
  metadata.video_title = "Gradient descent";
  auto text = FeatureExtractor::compose_content_text(
      metadata, "Study logistic regression");
  EXPECT_EQ(text.find("Page Title"), std::string::npos);
  EXPECT_NE(text.find("Video Title: Gradient descent"), std::string::npos);
  EXPECT_NE(text.find("Mission Context"), std::string::npos);
}

TEST_F(FeatureExtractorTest, FeatureNames) {
  EXPECT_EQ(get_feature_name(0), "url_text_0");
  EXPECT_EQ(get_feature_name(FeatureLayout::MISSION_TEXT_OFFSET + 3),
            "mission_text_3");
  EXPECT_EQ(get_feature_name(feature_index(StructuralFeature::PATH_DEPTH)),
            "structural.path_depth");
  EXPECT_EQ(get_feature_name(feature_index(TemporalFeature::IS_WEEKEND)),
            "temporal.is_weekend");
  EXPECT_EQ(get_feature_name(FeatureLayout::FEATURE_COUNT), "UNKNOWN_FEATURE");
}
