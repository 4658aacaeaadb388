#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "detection/verdict.hpp"
#include "nlohmann/json.hpp"

#include <string>

namespace JsonFormatter {

// {"allowed", "action", "confidence", "source", "reason"}
nlohmann::json verdict_to_json(const Verdict &verdict);

nlohmann::json verdict_log_entry_to_json(const VerdictLogEntry &entry);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
