#ifndef PAGE_METADATA_HPP
#define PAGE_METADATA_HPP

#include "nlohmann/json.hpp"

#include <cstddef>
#include <string>
#include <vector>

// Everything the slow path knows about a page. Fields that were not supplied
// stay empty or zero and read as neutral to the feature extractor.
struct PageMetadata {
  std::string url;
  std::string domain;
  std::string path;
  std::vector<std::string> query_params;

  std::string title;
  std::string description;
  std::vector<std::string> keywords;
  std::string extracted_text;

  std::string video_title;
  std::string video_description;
  std::string video_channel;

  bool has_video = false;
  bool has_forms = false;
  size_t content_length = 0;
  double quality_score = 0.0;
  int educational_indicators = 0;
  int entertainment_indicators = 0;

  // URL-derived fields only, used whenever a fetch is skipped or fails
  static PageMetadata basic(const std::string &url);
};

namespace MetadataScoring {

const std::vector<std::string> &educational_keywords();
const std::vector<std::string> &entertainment_keywords();

int count_indicators(const std::string &lowered_text,
                     const std::vector<std::string> &keywords);

// Fills the indicator counts and quality score from title and description
void score_content(PageMetadata &metadata);

} // namespace MetadataScoring

// Lenient: missing or mistyped fields keep their defaults. The URL-derived
// fields are recomputed when the document omits them.
PageMetadata page_metadata_from_json(const nlohmann::json &j);
nlohmann::json page_metadata_to_json(const PageMetadata &metadata);

#endif // PAGE_METADATA_HPP
