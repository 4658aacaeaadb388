#include "models/feature_extractor.hpp"
#include "core/logger.hpp"
#include "utils/stable_hash.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <set>
#include <sstream>

namespace {

// Non-overlapping occurrences, like str.count
double count_of(std::string_view text, std::string_view needle) {
  if (needle.empty())
    return 0.0;
  size_t count = 0;
  size_t pos = text.find(needle);
  while (pos != std::string_view::npos) {
    ++count;
    pos = text.find(needle, pos + needle.size());
  }
  return static_cast<double>(count);
}

double count_of(std::string_view text, char c) {
  return static_cast<double>(std::count(text.begin(), text.end(), c));
}

double flag(bool value) { return value ? 1.0 : 0.0; }

struct CharClassCounts {
  double alpha = 0.0;
  double digit = 0.0;
  double non_alnum = 0.0;
};

CharClassCounts count_char_classes(std::string_view text) {
  CharClassCounts counts;
  for (unsigned char c : text) {
    if (std::isalpha(c))
      counts.alpha += 1.0;
    else if (std::isdigit(c))
      counts.digit += 1.0;
    if (!std::isalnum(c))
      counts.non_alnum += 1.0;
  }
  return counts;
}

struct WordLengthStats {
  double average = 0.0;
  double longest = 0.0;
  double long_words = 0.0; // longer than 10 characters
};

WordLengthStats word_length_stats(const std::vector<std::string> &words) {
  WordLengthStats stats;
  if (words.empty())
    return stats;
  size_t total = 0;
  for (const auto &word : words) {
    total += word.size();
    stats.longest = std::max(stats.longest, static_cast<double>(word.size()));
    if (word.size() > 10)
      stats.long_words += 1.0;
  }
  stats.average = static_cast<double>(total) / words.size();
  return stats;
}

double count_present(std::string_view text,
                     std::initializer_list<const char *> terms) {
  double n = 0.0;
  for (const char *term : terms)
    if (Utils::contains(text, term))
      n += 1.0;
  return n;
}

// Writes values from `offset`, never past `limit` slots
void write_block(std::vector<double> &out, size_t offset, size_t limit,
                 std::initializer_list<double> values) {
  size_t i = 0;
  for (double v : values) {
    if (i >= limit)
      break;
    out[offset + i++] = v;
  }
}

const std::vector<std::string> &topic_terms() {
  static const std::vector<std::string> terms = {
      "logistic regression", "machine learning", "python", "tutorial",
      "algorithm"};
  return terms;
}

} // namespace

TimeContext
TimeContext::from_time_point(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm local{};
  localtime_r(&t, &local);
  TimeContext ctx;
  ctx.hour = local.tm_hour;
  ctx.weekday = (local.tm_wday + 6) % 7;
  return ctx;
}

TimeContext TimeContext::now() {
  return from_time_point(std::chrono::system_clock::now());
}

double FeatureExtractor::hash_feature(const std::string &key) {
  uint64_t seeded = Utils::fnv1a_64(FeatureLayout::HASH_SEED);
  uint64_t h = Utils::fnv1a_64(key, seeded);
  return static_cast<double>(h % 1000) / 1000.0;
}

std::vector<double> FeatureExtractor::extract(const std::string &url,
                                              const std::string &mission,
                                              const TimeContext &when) const {
  return extract(PageMetadata::basic(url), mission, when);
}

std::vector<double> FeatureExtractor::extract(const PageMetadata &metadata,
                                              const std::string &mission,
                                              const TimeContext &when) const {
  LOG(LogLevel::TRACE, LogComponent::ML_FEATURES,
      "Entering extract for url " << metadata.url);

  std::vector<double> features(FeatureLayout::FEATURE_COUNT, 0.0);

  fill_url_text(features, metadata.url);
  fill_mission_text(features, mission);
  fill_content_text(features, compose_content_text(metadata, mission));
  fill_structural(features, metadata);
  fill_content(features, metadata);
  fill_temporal(features, when);

  LOG(LogLevel::TRACE, LogComponent::ML_FEATURES,
      "Extracted " << features.size() << " features, structural url_length="
                   << features[feature_index(StructuralFeature::URL_LENGTH)]);
  return features;
}

void FeatureExtractor::fill_url_text(std::vector<double> &out,
                                     const std::string &url) const {
  using namespace FeatureLayout;
  const std::string lower = Utils::to_lower_copy(url);
  const size_t base = URL_TEXT_OFFSET;
  const auto classes = count_char_classes(lower);

  write_block(out, base, TEXT_STATS_SLOTS,
              {static_cast<double>(url.size()), count_of(lower, '/') + 1,
               count_of(lower, '.') + 1, count_of(lower, '/'),
               count_of(lower, '?'), count_of(lower, '&'),
               count_of(lower, '='), count_of(lower, '-'),
               count_of(lower, '_'), count_of(lower, '%'),
               static_cast<double>(lower.substr(0, lower.find('?')).size()),
               flag(Utils::contains(lower, "https")),
               flag(Utils::contains(lower, "www")),
               flag(Utils::contains(lower, ".com")),
               flag(Utils::contains(lower, ".org")),
               flag(Utils::contains(lower, ".edu")),
               flag(Utils::contains(lower, ".gov")), classes.alpha,
               classes.digit, classes.non_alnum});

  write_block(
      out, base + TEXT_STATS_SLOTS, TEXT_INDICATOR_SLOTS,
      {count_of(lower, "youtube"), count_of(lower, "reddit"),
       count_of(lower, "github"), count_of(lower, "stackoverflow"),
       count_of(lower, "wikipedia"), count_of(lower, "docs"),
       count_of(lower, "learn"), count_of(lower, "tutorial"),
       count_of(lower, "course"), count_of(lower, "video"),
       count_of(lower, "watch"), count_of(lower, "search"),
       flag(count_present(lower, {"api", "doc", "guide"}) > 0),
       flag(count_present(lower, {"game", "play", "fun"}) > 0),
       count_of(lower, '/')});

  // Hash over the first five alphanumeric words
  std::string cleaned = lower;
  for (auto &c : cleaned)
    if (!std::isalnum(static_cast<unsigned char>(c)))
      c = ' ';
  auto words = Utils::split_whitespace(cleaned);
  std::string head;
  for (size_t i = 0; i < words.size() && i < 5; ++i) {
    if (i > 0)
      head += ' ';
    head += words[i];
  }
  const size_t hash_base = base + TEXT_STATS_SLOTS + TEXT_INDICATOR_SLOTS;
  for (size_t i = 0; i < TEXT_HASH_SLOTS; ++i)
    out[hash_base + i] =
        hash_feature("url_" + std::to_string(i) + "_" + head);
}

void FeatureExtractor::fill_mission_text(std::vector<double> &out,
                                         const std::string &mission) const {
  using namespace FeatureLayout;
  const std::string lower = Utils::to_lower_copy(mission);
  const size_t base = MISSION_TEXT_OFFSET;
  const auto words = Utils::split_whitespace(lower);
  const std::set<std::string> unique_words(words.begin(), words.end());
  const auto classes = count_char_classes(lower);
  const auto lengths = word_length_stats(words);

  write_block(out, base, TEXT_STATS_SLOTS,
              {static_cast<double>(mission.size()),
               static_cast<double>(words.size()),
               static_cast<double>(unique_words.size()), count_of(lower, ' '),
               count_of(lower, '.'), count_of(lower, ','),
               count_of(lower, '!'), count_of(lower, '?'),
               count_of(lower, ';'), count_of(lower, ':'), classes.alpha,
               classes.digit, classes.non_alnum, lengths.average,
               lengths.longest});

  write_block(
      out, base + TEXT_STATS_SLOTS, TEXT_INDICATOR_SLOTS,
      {count_present(lower,
                     {"learn", "study", "understand", "master", "tutorial"}),
       count_present(lower, {"work", "job", "project", "task", "complete"}),
       count_present(lower, {"create", "build", "develop", "design", "make"}),
       count_present(lower,
                     {"research", "find", "information", "data", "explore"}),
       count_present(lower,
                     {"skill", "practice", "improve", "training", "course"}),
       static_cast<double>(words.size()), count_of(lower, '?'),
       count_of(lower, '.')});

  const size_t hash_base = base + TEXT_STATS_SLOTS + TEXT_INDICATOR_SLOTS;
  for (size_t i = 0; i < TEXT_HASH_SLOTS; ++i) {
    const std::string word = i < words.size() ? words[i] : "empty";
    out[hash_base + i] =
        hash_feature("mission_" + std::to_string(i) + "_" + word);
  }
}

void FeatureExtractor::fill_content_text(
    std::vector<double> &out, const std::string &content_text) const {
  using namespace FeatureLayout;
  const std::string lower = Utils::to_lower_copy(content_text);
  const size_t base = CONTENT_TEXT_OFFSET;
  const auto words = Utils::split_whitespace(lower);
  const std::set<std::string> unique_words(words.begin(), words.end());
  const auto classes = count_char_classes(lower);
  const auto lengths = word_length_stats(words);
  const double sentences = count_of(lower, '.') + 1;

  write_block(out, base, TEXT_STATS_SLOTS,
              {static_cast<double>(content_text.size()),
               static_cast<double>(words.size()),
               static_cast<double>(unique_words.size()), sentences,
               count_of(lower, ' '), count_of(lower, '.'),
               count_of(lower, ','), count_of(lower, '!'),
               count_of(lower, '?'), count_of(lower, ':'),
               count_of(lower, ';'), count_of(lower, '"'),
               count_of(lower, '\''), classes.alpha, classes.digit,
               lengths.average, lengths.longest, lengths.long_words,
               count_of(lower, "http"), count_of(lower, "www")});

  const double word_count = std::max<double>(words.size(), 1.0);
  const bool has_lists =
      count_of(lower, "\xe2\x80\xa2") > 0 || count_of(lower, '-') > 3;
  const bool has_code =
      Utils::contains(lower, "code") || Utils::contains(lower, "function");

  write_block(
      out, base + TEXT_STATS_SLOTS, TEXT_INDICATOR_SLOTS,
      {count_present(lower, {"title", "heading", "header"}),
       count_present(lower, {"description", "summary", "about"}),
       count_present(lower, {"tutorial", "guide", "how to", "step"}),
       count_present(lower, {"documentation", "docs", "api", "reference"}),
       count_present(lower, {"learn", "course", "lesson", "education"}),
       flag(has_lists), flag(has_code), count_of(lower, '?') / word_count,
       sentences, lengths.longest});

  const size_t hash_base = base + TEXT_STATS_SLOTS + TEXT_INDICATOR_SLOTS;
  for (size_t i = 0; i < TEXT_HASH_SLOTS; ++i) {
    const std::string word = i < words.size() && i < 20 ? words[i] : "empty";
    out[hash_base + i] =
        hash_feature("content_" + std::to_string(i) + "_" + word);
  }
}

std::string FeatureExtractor::compose_content_text(const PageMetadata &metadata,
                                                   const std::string &mission) {
  std::vector<std::string> parts;

  if (!metadata.video_title.empty())
    parts.push_back("Video Title: " + metadata.video_title);
  if (!metadata.video_description.empty())
    parts.push_back("Video Description: " +
                    metadata.video_description.substr(0, 300));
  if (!metadata.video_channel.empty())
    parts.push_back("Channel: " + metadata.video_channel);

  if (metadata.educational_indicators > 0)
    parts.push_back("Educational Content Score: " +
                    std::to_string(metadata.educational_indicators));
  if (metadata.entertainment_indicators > 0)
    parts.push_back("Entertainment Content Score: " +
                    std::to_string(metadata.entertainment_indicators));

  // Page-level fields only stand in when no video fields exist
  if (metadata.video_title.empty() && !metadata.title.empty())
    parts.push_back("Page Title: " + metadata.title);
  if (metadata.video_description.empty() && !metadata.description.empty())
    parts.push_back("Description: " + metadata.description.substr(0, 200));

  if (!metadata.keywords.empty()) {
    std::string joined;
    for (size_t i = 0; i < metadata.keywords.size() && i < 10; ++i) {
      if (i > 0)
        joined += ' ';
      joined += metadata.keywords[i];
    }
    parts.push_back("Keywords: " + joined);
  }

  if (!metadata.extracted_text.empty() && metadata.video_title.empty())
    parts.push_back("Content: " + metadata.extracted_text.substr(0, 200));

  if (metadata.quality_score > 0) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << metadata.quality_score;
    parts.push_back("Quality Score: " + oss.str());
  }

  if (parts.empty()) {
    std::string stripped = metadata.url;
    size_t scheme = stripped.find("://");
    if (scheme != std::string::npos)
      stripped = stripped.substr(scheme + 3);
    std::replace(stripped.begin(), stripped.end(), '/', ' ');
    std::replace(stripped.begin(), stripped.end(), '-', ' ');
    std::replace(stripped.begin(), stripped.end(), '_', ' ');
    return "Website: " + stripped;
  }

  std::string combined;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      combined += " | ";
    combined += parts[i];
  }
  // Context marker the shipped weights were trained with
  if (Utils::contains(Utils::to_lower_copy(mission), "logistic regression"))
    combined += " | Mission Context: Machine Learning Education Focus";
  return combined;
}

void FeatureExtractor::fill_structural(std::vector<double> &out,
                                       const PageMetadata &metadata) const {
  const std::string url = Utils::to_lower_copy(metadata.url);
  const std::string domain = Utils::to_lower_copy(metadata.domain);
  const std::string path = Utils::to_lower_copy(metadata.path);
  const auto &params = metadata.query_params;
  auto has_param = [&](const char *name) {
    return std::find(params.begin(), params.end(), name) != params.end();
  };
  auto set = [&](StructuralFeature f, double v) { out[feature_index(f)] = v; };

  set(StructuralFeature::DOMAIN_DEPTH, count_of(domain, '.') + 1);
  set(StructuralFeature::IS_EDU_DOMAIN, flag(Utils::ends_with(domain, ".edu")));
  set(StructuralFeature::IS_ORG_DOMAIN, flag(Utils::ends_with(domain, ".org")));
  set(StructuralFeature::IS_GOV_DOMAIN, flag(Utils::ends_with(domain, ".gov")));
  set(StructuralFeature::IS_DOCS_HOST,
      flag(Utils::contains(domain, "docs") ||
           Utils::contains(domain, "documentation")));
  set(StructuralFeature::PATH_DEPTH, count_of(path, '/') + 1);
  set(StructuralFeature::IS_VIDEO_PATH,
      flag(count_present(path, {"/watch", "/video"}) > 0));
  set(StructuralFeature::IS_ARTICLE_PATH,
      flag(count_present(path, {"/article", "/post", "/blog"}) > 0));
  set(StructuralFeature::IS_SEARCH_PATH,
      flag(count_present(path, {"/search", "/results"}) > 0));
  set(StructuralFeature::IS_PROFILE_PATH,
      flag(count_present(path, {"/user", "/profile"}) > 0));
  set(StructuralFeature::QUERY_PARAM_COUNT, static_cast<double>(params.size()));
  set(StructuralFeature::HAS_SEARCH_QUERY,
      flag(has_param("q") || has_param("search")));
  set(StructuralFeature::URL_LENGTH, static_cast<double>(url.size()));
  set(StructuralFeature::AMPERSAND_COUNT, count_of(url, '&'));
  set(StructuralFeature::IS_HTTPS, flag(Utils::contains(url, "https")));
}

void FeatureExtractor::fill_content(std::vector<double> &out,
                                    const PageMetadata &metadata) const {
  auto set = [&](ContentFeature f, double v) { out[feature_index(f)] = v; };
  const double educational = metadata.educational_indicators;
  const double entertainment = metadata.entertainment_indicators;

  set(ContentFeature::HAS_TITLE, flag(!metadata.title.empty()));
  set(ContentFeature::HAS_DESCRIPTION, flag(!metadata.description.empty()));
  set(ContentFeature::KEYWORD_COUNT,
      static_cast<double>(metadata.keywords.size()));
  set(ContentFeature::CONTENT_LENGTH_NORM,
      static_cast<double>(metadata.content_length) / 10000.0);
  set(ContentFeature::HAS_VIDEO_TITLE, flag(!metadata.video_title.empty()));
  set(ContentFeature::HAS_VIDEO_DESCRIPTION,
      flag(!metadata.video_description.empty()));
  set(ContentFeature::HAS_VIDEO_CHANNEL, flag(!metadata.video_channel.empty()));
  set(ContentFeature::EDUCATIONAL_INDICATORS_NORM,
      std::min(educational / 10.0, 1.0));
  set(ContentFeature::ENTERTAINMENT_INDICATORS_NORM,
      std::min(entertainment / 10.0, 1.0));
  set(ContentFeature::QUALITY_SCORE, metadata.quality_score);

  if (entertainment > 0)
    set(ContentFeature::EDU_ENT_RATIO,
        std::min(educational / entertainment, 5.0) / 5.0);
  else
    set(ContentFeature::EDU_ENT_RATIO, flag(educational > 0));

  const std::string title = Utils::to_lower_copy(metadata.video_title);
  const std::string description =
      Utils::to_lower_copy(metadata.video_description);
  double title_hits = 0.0;
  double description_hits = 0.0;
  for (const auto &term : topic_terms()) {
    if (Utils::contains(title, term))
      title_hits += 1.0;
    if (Utils::contains(description, term))
      description_hits += 1.0;
  }
  set(ContentFeature::VIDEO_TITLE_TOPIC_ALIGNMENT,
      std::min(title_hits / 3.0, 1.0));
  set(ContentFeature::VIDEO_DESCRIPTION_TOPIC_ALIGNMENT,
      std::min(description_hits / 5.0, 1.0));
  set(ContentFeature::HAS_VIDEO, flag(metadata.has_video));
  set(ContentFeature::HAS_FORMS, flag(metadata.has_forms));
}

void FeatureExtractor::fill_temporal(std::vector<double> &out,
                                     const TimeContext &when) const {
  const int hour = std::clamp(when.hour, 0, 23);
  const int weekday = std::clamp(when.weekday, 0, 6);
  out[feature_index(TemporalFeature::HOUR_NORM)] = hour / 23.0;
  out[feature_index(TemporalFeature::WEEKDAY_NORM)] = weekday / 6.0;
  out[feature_index(TemporalFeature::IS_WORKING_HOURS)] =
      flag(hour >= 9 && hour <= 17);
  out[feature_index(TemporalFeature::IS_WEEKEND)] = flag(weekday >= 5);
}
