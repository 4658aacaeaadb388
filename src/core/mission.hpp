#ifndef MISSION_HPP
#define MISSION_HPP

#include "nlohmann/json.hpp"

#include <optional>
#include <string>
#include <vector>

// The user's declared goal for a session. Built once and then shared
// read-only; a new mission replaces the old one wholesale.
struct Mission {
  std::string text;
  std::vector<std::string> allowed_domains;  // lower-cased, no "www."
  std::vector<std::string> allowed_keywords; // lower-cased

  // Derived from text plus allowed_keywords at construction
  std::vector<std::string> keywords;

  static Mission from_text(const std::string &text);
  static Mission create(const std::string &text,
                        const std::vector<std::string> &allowed_domains,
                        const std::vector<std::string> &allowed_keywords);

  // Case-insensitive substring match of any mission keyword
  bool matches_text(const std::string &text) const;

  bool empty() const { return text.empty(); }
};

// Lower-cased tokens with punctuation trimmed, at least three characters and
// not stop words, followed by adjacent bigrams. De-duplicated, capped at 20.
std::vector<std::string> derive_mission_keywords(const std::string &text);

// Accepts missionText/allowedDomains/allowedKeywords and the older
// mission|description/allowed_domains/allowed_keywords spellings.
std::optional<Mission> mission_from_json(const nlohmann::json &j);
nlohmann::json mission_to_json(const Mission &mission);

// Empty optional when the file is missing, unreadable or not a mission
std::optional<Mission> load_mission_file(const std::string &path);

#endif // MISSION_HPP
