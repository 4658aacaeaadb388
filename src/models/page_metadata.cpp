#include "models/page_metadata.hpp"
#include "utils/utils.hpp"

#include <algorithm>

PageMetadata PageMetadata::basic(const std::string &url) {
  PageMetadata metadata;
  auto parts = Utils::parse_url(url);
  metadata.url = url;
  metadata.domain = parts.host;
  metadata.path = parts.path;
  metadata.query_params = parts.query_param_names;
  return metadata;
}

namespace MetadataScoring {

const std::vector<std::string> &educational_keywords() {
  static const std::vector<std::string> keywords = {
      "tutorial",         "learn",          "course",
      "education",        "explain",        "guide",
      "how to",           "lesson",         "teaching",
      "instruction",      "training",       "study",
      "academic",         "university",     "college",
      "research",         "analysis",       "theory",
      "concept",          "algorithm",      "programming",
      "coding",           "development",    "science",
      "mathematics",      "physics",        "chemistry",
      "biology",          "history",        "machine learning",
      "data science",     "artificial intelligence",
      "logistic regression", "neural network", "deep learning"};
  return keywords;
}

const std::vector<std::string> &entertainment_keywords() {
  static const std::vector<std::string> keywords = {
      "funny",     "comedy",     "meme",      "cute",
      "adorable",  "hilarious",  "lol",       "entertainment",
      "fun",       "game",       "play",      "music video",
      "vlog",      "reaction",   "prank",     "challenge",
      "trend",     "viral",      "cat",       "dog",
      "pet",       "animal compilation", "fail", "epic",
      "awesome",   "cool",       "amazing",   "incredible",
      "unbelievable", "shocking"};
  return keywords;
}

int count_indicators(const std::string &lowered_text,
                     const std::vector<std::string> &keywords) {
  return static_cast<int>(
      std::count_if(keywords.begin(), keywords.end(),
                    [&](const std::string &keyword) {
                      return Utils::contains(lowered_text, keyword);
                    }));
}

void score_content(PageMetadata &metadata) {
  const std::string &title =
      metadata.video_title.empty() ? metadata.title : metadata.video_title;
  const std::string &description = metadata.video_description.empty()
                                       ? metadata.description
                                       : metadata.video_description;
  std::string text = Utils::to_lower_copy(title + " " + description);

  int educational = count_indicators(text, educational_keywords());
  int entertainment = count_indicators(text, entertainment_keywords());
  metadata.educational_indicators = educational;
  metadata.entertainment_indicators = entertainment;

  double quality = 0.0;
  if (description.size() > 200)
    quality += 0.3;
  if (title.size() > 30)
    quality += 0.2;
  if (educational > entertainment)
    quality += 0.5;
  else if (entertainment > educational * 2)
    quality -= 0.4;
  metadata.quality_score = std::clamp(quality, 0.0, 1.0);
}

} // namespace MetadataScoring

namespace {

template <typename T>
void read_field(const nlohmann::json &j, const char *key, T &out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return;
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception &) {
    // Mistyped fields keep their neutral default
  }
}

} // namespace

PageMetadata page_metadata_from_json(const nlohmann::json &j) {
  std::string url;
  read_field(j, "url", url);
  PageMetadata metadata = PageMetadata::basic(url);
  if (!j.is_object())
    return metadata;

  read_field(j, "domain", metadata.domain);
  read_field(j, "path", metadata.path);
  read_field(j, "query_params", metadata.query_params);
  read_field(j, "title", metadata.title);
  read_field(j, "description", metadata.description);
  if (metadata.description.empty())
    read_field(j, "meta_description", metadata.description);
  read_field(j, "keywords", metadata.keywords);
  if (metadata.keywords.empty())
    read_field(j, "content_keywords", metadata.keywords);
  read_field(j, "extracted_text", metadata.extracted_text);
  read_field(j, "video_title", metadata.video_title);
  read_field(j, "video_description", metadata.video_description);
  read_field(j, "video_channel", metadata.video_channel);
  read_field(j, "has_video", metadata.has_video);
  read_field(j, "has_forms", metadata.has_forms);
  read_field(j, "content_length", metadata.content_length);
  read_field(j, "quality_score", metadata.quality_score);
  read_field(j, "educational_indicators", metadata.educational_indicators);
  read_field(j, "entertainment_indicators", metadata.entertainment_indicators);
  return metadata;
}

nlohmann::json page_metadata_to_json(const PageMetadata &metadata) {
  return {{"url", metadata.url},
          {"domain", metadata.domain},
          {"path", metadata.path},
          {"query_params", metadata.query_params},
          {"title", metadata.title},
          {"description", metadata.description},
          {"keywords", metadata.keywords},
          {"extracted_text", metadata.extracted_text},
          {"video_title", metadata.video_title},
          {"video_description", metadata.video_description},
          {"video_channel", metadata.video_channel},
          {"has_video", metadata.has_video},
          {"has_forms", metadata.has_forms},
          {"content_length", metadata.content_length},
          {"quality_score", metadata.quality_score},
          {"educational_indicators", metadata.educational_indicators},
          {"entertainment_indicators", metadata.entertainment_indicators}};
}
