#ifndef SESSION_STORE_HPP
#define SESSION_STORE_HPP

#include "nlohmann/json.hpp"

#include <cstdint>
#include <optional>
#include <string>

// What survives a supervisor restart. Holds the secret's hash only.
struct SessionRecord {
  static constexpr int FORMAT_VERSION = 1;

  std::string task;
  uint64_t start_time_ms = 0;
  uint64_t end_time_ms = 0;
  double duration_hours = 0.0;
  int proxy_port = 0;
  std::string secret_hash;
};

nlohmann::json session_record_to_json(const SessionRecord &record);
// Throws on missing or mistyped fields and on an unknown format version
SessionRecord session_record_from_json(const nlohmann::json &j);

class SessionStore {
public:
  explicit SessionStore(std::string path);

  // Atomic replace
  bool save(const SessionRecord &record);
  // Empty when there is no record or it cannot be read
  std::optional<SessionRecord> load() const;
  bool clear();
  bool exists() const;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

#endif // SESSION_STORE_HPP
