#include "rule_engine.hpp"
#include "core/logger.hpp"
#include "rules/domain_lists.hpp"

#include <algorithm>

namespace {

template <typename List>
bool host_in(const std::string &host, const List &domains) {
  for (const auto &domain : domains)
    if (Utils::host_matches_domain(host, domain))
      return true;
  return false;
}

// "/embed" matches "/embed" and "/embed/xyz" but not "/embedded"
bool path_has_prefix(const std::string &path, std::string_view prefix) {
  if (!Utils::starts_with(path, prefix))
    return false;
  return path.size() == prefix.size() || prefix.back() == '/' ||
         path[prefix.size()] == '/';
}

bool is_video_platform(const std::string &host) {
  return host_in(host, DomainLists::VIDEO_PLATFORM_HOSTS);
}

} // namespace

const char *tier_to_string(RuleTier tier) {
  switch (tier) {
  case RuleTier::SHORT_FORM_FEED:
    return "short-form feed";
  case RuleTier::INFRASTRUCTURE:
    return "infrastructure";
  case RuleTier::EDUCATIONAL_DOMAIN:
    return "educational";
  case RuleTier::DISTRACTION_DOMAIN:
    return "distraction domain";
  case RuleTier::FEED_PATTERN:
    return "feed pattern";
  case RuleTier::WATCH_ENDPOINT:
    return "watch endpoint";
  case RuleTier::SEARCH_ENGINE:
    return "search engine";
  case RuleTier::DEFAULT:
    return "default";
  }
  return "unknown";
}

RuleEngine::RuleEngine(const Config::RuleTierConfig &cfg) {
  reconfigure(cfg);
  LOG(LogLevel::INFO, LogComponent::RULES_EVAL,
      "RuleEngine created with " << educational_domains_.size()
                                 << " educational and "
                                 << blocked_domains_.size()
                                 << " blocked domains.");
}

void RuleEngine::reconfigure(const Config::RuleTierConfig &new_config) {
  config_ = new_config;

  educational_domains_.assign(std::begin(DomainLists::EDUCATIONAL_DOMAINS),
                              std::end(DomainLists::EDUCATIONAL_DOMAINS));
  for (const auto &extra : config_.extra_educational_domains)
    educational_domains_.push_back(Utils::to_lower_copy(extra));

  blocked_domains_.assign(std::begin(DomainLists::DISTRACTION_DOMAINS),
                          std::end(DomainLists::DISTRACTION_DOMAINS));
  for (const auto &extra : config_.extra_blocked_domains)
    blocked_domains_.push_back(Utils::to_lower_copy(extra));
}

RuleVerdict RuleEngine::evaluate(const std::string &url,
                                 const Mission *mission,
                                 const std::string &page_text) const {
  if (!config_.enabled)
    return make_verdict(url, AdmissionAction::ALLOW, RuleTier::DEFAULT,
                        "rule tier disabled");

  const Utils::UrlParts parts = Utils::parse_url(url);
  if (parts.host.empty())
    LOG(LogLevel::DEBUG, LogComponent::RULES_EVAL,
        "No host in '" << url << "', treating as unknown domain.");

  if (is_short_form_feed(parts))
    return make_verdict(url, AdmissionAction::BLOCK, RuleTier::SHORT_FORM_FEED,
                        "short-form feed");

  if (is_infrastructure(parts))
    return make_verdict(url, AdmissionAction::ALLOW, RuleTier::INFRASTRUCTURE,
                        "infrastructure");

  if (is_educational_domain(parts, mission))
    return make_verdict(url, AdmissionAction::ALLOW,
                        RuleTier::EDUCATIONAL_DOMAIN, "educational");

  if (is_distraction_domain(parts))
    return make_verdict(url, AdmissionAction::BLOCK,
                        RuleTier::DISTRACTION_DOMAIN, "distraction domain");

  if (is_feed_pattern(parts))
    return make_verdict(url, AdmissionAction::BLOCK, RuleTier::FEED_PATTERN,
                        "feed pattern");

  if (is_watch_endpoint(parts)) {
    const std::string decoded = Utils::url_decode(parts.lowered);
    for (const char *keyword : DomainLists::EDUCATIONAL_URL_KEYWORDS)
      if (Utils::contains(decoded, keyword))
        return make_verdict(url, AdmissionAction::ALLOW,
                            RuleTier::WATCH_ENDPOINT, "educational video");

    if (Utils::trim_copy(page_text).empty())
      return make_verdict(url, AdmissionAction::ALLOW, RuleTier::WATCH_ENDPOINT,
                          "video without metadata");
    if (mission == nullptr || mission->keywords.empty())
      return make_verdict(url, AdmissionAction::ALLOW, RuleTier::WATCH_ENDPOINT,
                          "video, no mission keywords");
    if (mission->matches_text(page_text))
      return make_verdict(url, AdmissionAction::ALLOW, RuleTier::WATCH_ENDPOINT,
                          "video mission-aligned");
    return make_verdict(url, AdmissionAction::BLOCK, RuleTier::WATCH_ENDPOINT,
                        "video not mission-aligned");
  }

  if (is_search_engine(parts))
    return make_verdict(url, AdmissionAction::ALLOW, RuleTier::SEARCH_ENGINE,
                        "search engine");

  return make_verdict(url, AdmissionAction::ALLOW, RuleTier::DEFAULT,
                      "default");
}

bool RuleEngine::is_short_form_feed(const Utils::UrlParts &url) const {
  if (is_video_platform(url.host)) {
    for (const char *marker : DomainLists::YOUTUBE_SHORTS_MARKERS)
      if (Utils::contains(url.lowered, marker))
        return true;
  }
  if (Utils::host_matches_domain(url.host, "instagram.com")) {
    for (const char *path : DomainLists::INSTAGRAM_REEL_PATHS)
      if (path_has_prefix(url.path, path) || Utils::contains(url.path, path))
        return true;
  }
  return false;
}

bool RuleEngine::is_infrastructure(const Utils::UrlParts &url) const {
  if (host_in(url.host, DomainLists::INFRASTRUCTURE_HOSTS))
    return true;
  if (is_video_platform(url.host)) {
    for (const char *prefix : DomainLists::YOUTUBE_INFRASTRUCTURE_PATHS)
      if (path_has_prefix(url.path, prefix))
        return true;
  }
  return false;
}

bool RuleEngine::is_educational_domain(const Utils::UrlParts &url,
                                       const Mission *mission) const {
  if (host_in(url.host, educational_domains_))
    return true;
  return mission != nullptr && host_in(url.host, mission->allowed_domains);
}

bool RuleEngine::is_distraction_domain(const Utils::UrlParts &url) const {
  return host_in(url.host, blocked_domains_);
}

bool RuleEngine::is_feed_pattern(const Utils::UrlParts &url) const {
  for (const auto &feed : DomainLists::PLATFORM_FEEDS)
    if (Utils::host_matches_domain(url.host, feed.host) &&
        path_has_prefix(url.path, feed.path))
      return true;

  for (auto segment : Utils::split_string_view(url.path, '/')) {
    for (const char *feed_segment : DomainLists::FEED_PATH_SEGMENTS)
      if (segment == feed_segment)
        return true;
  }
  return false;
}

bool RuleEngine::is_watch_endpoint(const Utils::UrlParts &url) const {
  if (is_video_platform(url.host)) {
    if (path_has_prefix(url.path, "/watch"))
      return true;
    for (const char *marker : DomainLists::VIDEO_PLAYER_MARKERS)
      if (Utils::contains(url.path, marker))
        return true;
  }
  return host_in(url.host, DomainLists::SHORT_LINK_HOSTS) &&
         url.path.size() > 1;
}

bool RuleEngine::is_search_engine(const Utils::UrlParts &url) const {
  return host_in(url.host, DomainLists::SEARCH_ENGINES);
}

RuleVerdict RuleEngine::make_verdict(const std::string &url,
                                     AdmissionAction action, RuleTier tier,
                                     std::string reason) const {
  LOG(LogLevel::INFO, LogComponent::RULES_EVAL,
      action_to_string(action) << ": " << url << " (" << reason << ")");
  return RuleVerdict{action, tier, std::move(reason)};
}
