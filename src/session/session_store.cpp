#include "session/session_store.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

nlohmann::json session_record_to_json(const SessionRecord &record) {
  return {{"format_version", SessionRecord::FORMAT_VERSION},
          {"task", record.task},
          {"start_time_ms", record.start_time_ms},
          {"end_time_ms", record.end_time_ms},
          {"duration_hours", record.duration_hours},
          {"proxy_port", record.proxy_port},
          {"secret_hash", record.secret_hash}};
}

SessionRecord session_record_from_json(const nlohmann::json &j) {
  int version = j.at("format_version").get<int>();
  if (version != SessionRecord::FORMAT_VERSION)
    throw std::runtime_error("unsupported session record version " +
                             std::to_string(version));

  SessionRecord record;
  record.task = j.at("task").get<std::string>();
  record.start_time_ms = j.at("start_time_ms").get<uint64_t>();
  record.end_time_ms = j.at("end_time_ms").get<uint64_t>();
  record.duration_hours = j.at("duration_hours").get<double>();
  record.proxy_port = j.at("proxy_port").get<int>();
  record.secret_hash = j.at("secret_hash").get<std::string>();
  return record;
}

SessionStore::SessionStore(std::string path) : path_(std::move(path)) {}

bool SessionStore::save(const SessionRecord &record) {
  if (!Utils::write_file_atomically(path_,
                                    session_record_to_json(record).dump(2))) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Failed to write session record to " << path_);
    return false;
  }
  LOG(LogLevel::DEBUG, LogComponent::STATE_PERSIST,
      "Session record written to " << path_);
  return true;
}

std::optional<SessionRecord> SessionStore::load() const {
  std::ifstream in(path_);
  if (!in.is_open())
    return std::nullopt;
  try {
    return session_record_from_json(nlohmann::json::parse(in));
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Unreadable session record " << path_ << ": " << e.what());
    return std::nullopt;
  }
}

bool SessionStore::clear() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Failed to remove session record " << path_ << ": " << ec.message());
    return false;
  }
  return true;
}

bool SessionStore::exists() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}
