#include "features.hpp"

#include <array>

namespace {

constexpr std::array<const char *, FeatureLayout::STRUCTURAL_SIZE>
    STRUCTURAL_NAMES = {"domain_depth",      "is_edu_domain",
                        "is_org_domain",     "is_gov_domain",
                        "is_docs_host",      "path_depth",
                        "is_video_path",     "is_article_path",
                        "is_search_path",    "is_profile_path",
                        "query_param_count", "has_search_query",
                        "url_length",        "ampersand_count",
                        "is_https"};

constexpr std::array<const char *, FeatureLayout::CONTENT_SIZE> CONTENT_NAMES =
    {"has_title",
     "has_description",
     "keyword_count",
     "content_length_norm",
     "has_video_title",
     "has_video_description",
     "has_video_channel",
     "educational_indicators_norm",
     "entertainment_indicators_norm",
     "quality_score",
     "edu_ent_ratio",
     "video_title_topic_alignment",
     "video_description_topic_alignment",
     "has_video",
     "has_forms"};

constexpr std::array<const char *, FeatureLayout::TEMPORAL_SIZE>
    TEMPORAL_NAMES = {"hour_norm", "weekday_norm", "is_working_hours",
                      "is_weekend"};

} // namespace

std::string get_feature_name(size_t index) {
  using namespace FeatureLayout;
  if (index < MISSION_TEXT_OFFSET)
    return "url_text_" + std::to_string(index - URL_TEXT_OFFSET);
  if (index < CONTENT_TEXT_OFFSET)
    return "mission_text_" + std::to_string(index - MISSION_TEXT_OFFSET);
  if (index < STRUCTURAL_OFFSET)
    return "content_text_" + std::to_string(index - CONTENT_TEXT_OFFSET);
  if (index < CONTENT_OFFSET)
    return std::string("structural.") +
           STRUCTURAL_NAMES[index - STRUCTURAL_OFFSET];
  if (index < TEMPORAL_OFFSET)
    return std::string("content.") + CONTENT_NAMES[index - CONTENT_OFFSET];
  if (index < FEATURE_COUNT)
    return std::string("temporal.") + TEMPORAL_NAMES[index - TEMPORAL_OFFSET];
  return "UNKNOWN_FEATURE";
}
