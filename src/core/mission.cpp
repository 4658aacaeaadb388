#include "core/mission.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace {

constexpr size_t MAX_DERIVED_KEYWORDS = 20;
constexpr const char *TRIM_CHARS = ".,:;!?'\"()[]{}";

const std::unordered_set<std::string> &stop_words() {
  static const std::unordered_set<std::string> words = {
      "the",    "and",   "for",    "with",  "about", "that",   "this",
      "from",   "into",  "your",   "their", "there", "then",   "have",
      "will",   "should", "would", "could", "what",  "when",   "where",
      "why",    "how",   "make",   "create", "work", "task",   "focus",
      "session", "goal", "doing",  "do",    "on",    "to",     "of",
      "in",     "at",    "a",      "an"};
  return words;
}

std::string strip_punctuation(const std::string &token) {
  size_t start = token.find_first_not_of(TRIM_CHARS);
  if (start == std::string::npos)
    return "";
  size_t end = token.find_last_not_of(TRIM_CHARS);
  return token.substr(start, end - start + 1);
}

std::string normalise_domain(const std::string &raw) {
  std::string domain = Utils::to_lower_copy(Utils::trim_copy(raw));
  if (domain.find("://") != std::string::npos || domain.find('/') != std::string::npos)
    domain = Utils::parse_url(domain.find("://") == std::string::npos
                                  ? "http://" + domain
                                  : domain)
                 .host;
  if (Utils::starts_with(domain, "www."))
    domain = domain.substr(4);
  return domain;
}

std::vector<std::string> read_string_list(const nlohmann::json &j,
                                          const char *key,
                                          const char *fallback_key) {
  std::vector<std::string> out;
  auto it = j.find(key);
  if (it == j.end())
    it = j.find(fallback_key);
  if (it == j.end() || !it->is_array())
    return out;
  for (const auto &item : *it)
    if (item.is_string())
      out.push_back(item.get<std::string>());
  return out;
}

} // namespace

std::vector<std::string> derive_mission_keywords(const std::string &text) {
  std::vector<std::string> base;
  for (const auto &raw : Utils::split_whitespace(Utils::to_lower_copy(text))) {
    std::string token = strip_punctuation(raw);
    if (token.size() >= 3 && stop_words().count(token) == 0)
      base.push_back(token);
  }

  std::vector<std::string> candidates = base;
  for (size_t i = 0; i + 1 < base.size(); ++i)
    candidates.push_back(base[i] + " " + base[i + 1]);

  std::vector<std::string> keywords;
  for (const auto &candidate : candidates) {
    if (std::find(keywords.begin(), keywords.end(), candidate) ==
        keywords.end())
      keywords.push_back(candidate);
    if (keywords.size() == MAX_DERIVED_KEYWORDS)
      break;
  }
  return keywords;
}

Mission Mission::from_text(const std::string &text) {
  return create(text, {}, {});
}

Mission Mission::create(const std::string &text,
                        const std::vector<std::string> &allowed_domains,
                        const std::vector<std::string> &allowed_keywords) {
  Mission mission;
  mission.text = Utils::trim_copy(text);
  for (const auto &domain : allowed_domains) {
    std::string normalised = normalise_domain(domain);
    if (!normalised.empty())
      mission.allowed_domains.push_back(normalised);
  }
  for (const auto &keyword : allowed_keywords) {
    std::string lowered = Utils::to_lower_copy(Utils::trim_copy(keyword));
    if (!lowered.empty())
      mission.allowed_keywords.push_back(lowered);
  }

  mission.keywords = derive_mission_keywords(mission.text);
  for (const auto &keyword : mission.allowed_keywords)
    if (std::find(mission.keywords.begin(), mission.keywords.end(), keyword) ==
        mission.keywords.end())
      mission.keywords.push_back(keyword);
  return mission;
}

bool Mission::matches_text(const std::string &text) const {
  if (text.empty())
    return false;
  const std::string lowered = Utils::to_lower_copy(text);
  return std::any_of(keywords.begin(), keywords.end(),
                     [&](const std::string &keyword) {
                       return Utils::contains(lowered, keyword);
                     });
}

std::optional<Mission> mission_from_json(const nlohmann::json &j) {
  if (!j.is_object())
    return std::nullopt;

  std::string text;
  for (const char *key : {"missionText", "mission", "description"}) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
      text = it->get<std::string>();
      break;
    }
  }
  if (Utils::trim_copy(text).empty())
    return std::nullopt;

  return Mission::create(
      text, read_string_list(j, "allowedDomains", "allowed_domains"),
      read_string_list(j, "allowedKeywords", "allowed_keywords"));
}

nlohmann::json mission_to_json(const Mission &mission) {
  return {{"missionText", mission.text},
          {"allowedDomains", mission.allowed_domains},
          {"allowedKeywords", mission.allowed_keywords},
          {"keywords", mission.keywords}};
}

std::optional<Mission> load_mission_file(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    LOG(LogLevel::WARN, LogComponent::CONFIG,
        "Mission file not found: " << path);
    return std::nullopt;
  }

  try {
    auto mission = mission_from_json(nlohmann::json::parse(in));
    if (!mission)
      LOG(LogLevel::WARN, LogComponent::CONFIG,
          "Mission file " << path << " has no mission text.");
    return mission;
  } catch (const nlohmann::json::exception &e) {
    LOG(LogLevel::WARN, LogComponent::CONFIG,
        "Could not parse mission file " << path << ": " << e.what());
    return std::nullopt;
  }
}
