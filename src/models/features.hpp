#ifndef FEATURES_HPP
#define FEATURES_HPP

#include <cstddef>
#include <string>

// Layout of the admission feature vector. Any change to the order or the
// hashing scheme must bump SCHEMA_VERSION so stale weight files are rejected.
namespace FeatureLayout {
constexpr int SCHEMA_VERSION = 2;
constexpr const char *HASH_SEED = "anchorite-fv2";

constexpr size_t TEXT_BLOCK_SIZE = 384;
constexpr size_t TEXT_STATS_SLOTS = 50;
constexpr size_t TEXT_INDICATOR_SLOTS = 100;
constexpr size_t TEXT_HASH_SLOTS = 234;

constexpr size_t URL_TEXT_OFFSET = 0;
constexpr size_t MISSION_TEXT_OFFSET = URL_TEXT_OFFSET + TEXT_BLOCK_SIZE;
constexpr size_t CONTENT_TEXT_OFFSET = MISSION_TEXT_OFFSET + TEXT_BLOCK_SIZE;
constexpr size_t STRUCTURAL_OFFSET = CONTENT_TEXT_OFFSET + TEXT_BLOCK_SIZE;
constexpr size_t STRUCTURAL_SIZE = 15;
constexpr size_t CONTENT_OFFSET = STRUCTURAL_OFFSET + STRUCTURAL_SIZE;
constexpr size_t CONTENT_SIZE = 15;
constexpr size_t TEMPORAL_OFFSET = CONTENT_OFFSET + CONTENT_SIZE;
constexpr size_t TEMPORAL_SIZE = 4;

constexpr size_t FEATURE_COUNT = TEMPORAL_OFFSET + TEMPORAL_SIZE;
} // namespace FeatureLayout

static_assert(FeatureLayout::TEXT_STATS_SLOTS +
                      FeatureLayout::TEXT_INDICATOR_SLOTS +
                      FeatureLayout::TEXT_HASH_SLOTS ==
                  FeatureLayout::TEXT_BLOCK_SIZE,
              "text block slots must fill the block");
static_assert(FeatureLayout::FEATURE_COUNT == 1186,
              "feature vector length is part of the weight file contract");

enum class StructuralFeature {
  DOMAIN_DEPTH,
  IS_EDU_DOMAIN,
  IS_ORG_DOMAIN,
  IS_GOV_DOMAIN,
  IS_DOCS_HOST,
  PATH_DEPTH,
  IS_VIDEO_PATH,
  IS_ARTICLE_PATH,
  IS_SEARCH_PATH,
  IS_PROFILE_PATH,
  QUERY_PARAM_COUNT,
  HAS_SEARCH_QUERY,
  URL_LENGTH,
  AMPERSAND_COUNT,
  IS_HTTPS,

  STRUCTURAL_FEATURE_COUNT
};

enum class ContentFeature {
  HAS_TITLE,
  HAS_DESCRIPTION,
  KEYWORD_COUNT,
  CONTENT_LENGTH_NORM,
  HAS_VIDEO_TITLE,
  HAS_VIDEO_DESCRIPTION,
  HAS_VIDEO_CHANNEL,
  EDUCATIONAL_INDICATORS_NORM,
  ENTERTAINMENT_INDICATORS_NORM,
  QUALITY_SCORE,
  EDU_ENT_RATIO,
  VIDEO_TITLE_TOPIC_ALIGNMENT,
  VIDEO_DESCRIPTION_TOPIC_ALIGNMENT,
  HAS_VIDEO,
  HAS_FORMS,

  CONTENT_FEATURE_COUNT
};

enum class TemporalFeature {
  HOUR_NORM,
  WEEKDAY_NORM,
  IS_WORKING_HOURS,
  IS_WEEKEND,

  TEMPORAL_FEATURE_COUNT
};

static_assert(static_cast<size_t>(
                  StructuralFeature::STRUCTURAL_FEATURE_COUNT) ==
                  FeatureLayout::STRUCTURAL_SIZE,
              "structural block size");
static_assert(static_cast<size_t>(ContentFeature::CONTENT_FEATURE_COUNT) ==
                  FeatureLayout::CONTENT_SIZE,
              "content block size");
static_assert(static_cast<size_t>(TemporalFeature::TEMPORAL_FEATURE_COUNT) ==
                  FeatureLayout::TEMPORAL_SIZE,
              "temporal block size");

constexpr size_t feature_index(StructuralFeature f) {
  return FeatureLayout::STRUCTURAL_OFFSET + static_cast<size_t>(f);
}
constexpr size_t feature_index(ContentFeature f) {
  return FeatureLayout::CONTENT_OFFSET + static_cast<size_t>(f);
}
constexpr size_t feature_index(TemporalFeature f) {
  return FeatureLayout::TEMPORAL_OFFSET + static_cast<size_t>(f);
}

// Human-readable name of a slot in the vector, e.g. "url_text_17" or
// "structural.path_depth"
std::string get_feature_name(size_t index);

#endif // FEATURES_HPP
