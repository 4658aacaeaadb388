#ifndef RULE_ENGINE_HPP
#define RULE_ENGINE_HPP

#include "core/config.hpp"
#include "core/mission.hpp"
#include "detection/verdict.hpp"
#include "utils/utils.hpp"

#include <string>
#include <vector>

// Tiers in evaluation order. The first tier that matches decides.
enum class RuleTier {
  SHORT_FORM_FEED = 1,
  INFRASTRUCTURE,
  EDUCATIONAL_DOMAIN,
  DISTRACTION_DOMAIN,
  FEED_PATTERN,
  WATCH_ENDPOINT,
  SEARCH_ENGINE,
  DEFAULT
};

const char *tier_to_string(RuleTier tier);

struct RuleVerdict {
  AdmissionAction action = AdmissionAction::ALLOW;
  RuleTier tier = RuleTier::DEFAULT;
  std::string reason;
};

class RuleEngine {
public:
  explicit RuleEngine(const Config::RuleTierConfig &cfg);

  // Never throws. `mission` may be null. `page_text` is the title and
  // description text used by the watch-endpoint alignment check; when empty
  // that check allows.
  RuleVerdict evaluate(const std::string &url, const Mission *mission,
                       const std::string &page_text = "") const;

  void reconfigure(const Config::RuleTierConfig &new_config);

private:
  bool is_short_form_feed(const Utils::UrlParts &url) const;
  bool is_infrastructure(const Utils::UrlParts &url) const;
  bool is_educational_domain(const Utils::UrlParts &url,
                             const Mission *mission) const;
  bool is_distraction_domain(const Utils::UrlParts &url) const;
  bool is_feed_pattern(const Utils::UrlParts &url) const;
  bool is_watch_endpoint(const Utils::UrlParts &url) const;
  bool is_search_engine(const Utils::UrlParts &url) const;

  RuleVerdict make_verdict(const std::string &url, AdmissionAction action,
                           RuleTier tier, std::string reason) const;

  Config::RuleTierConfig config_;
  std::vector<std::string> educational_domains_;
  std::vector<std::string> blocked_domains_;
};

#endif // RULE_ENGINE_HPP
