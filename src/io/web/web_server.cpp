#include "web_server.hpp"
#include "core/logger.hpp"
#include "core/mission.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

using json = nlohmann::json;

namespace {

void reply(httplib::Response &res, int status, const json &body) {
  res.status = status;
  res.set_content(body.dump(2), "application/json");
}

// Empty optional (and a 400 already written) when the body is not a JSON
// object
std::optional<json> parse_body(const httplib::Request &req,
                               httplib::Response &res) {
  json body = json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    reply(res, 400, {{"error", "request body must be a JSON object"}});
    return std::nullopt;
  }
  return body;
}

} // namespace

WebServer::WebServer(const Config::AppConfig &config,
                     MetricsRegistry &metrics_registry, DecisionEngine &engine,
                     SessionSupervisor &supervisor)
    : config_(config), metrics_registry_(metrics_registry), engine_(engine),
      supervisor_(supervisor) {
  server_ = std::make_unique<httplib::Server>();

  server_->Get("/metrics", [this](const httplib::Request &req,
                                  httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "Received request for /metrics from " << req.remote_addr);
    res.set_content(metrics_registry_.serialize(),
                    "text/plain; version=0.0.4");
  });

  server_->Get("/health", [](const httplib::Request &, httplib::Response &res) {
    reply(res, 200, {{"status", "ok"}});
  });

  register_decision_routes();
  register_session_routes();
  register_admin_routes();

  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server initialized for " << config_.web_server.host << ":"
                                    << config_.web_server.port);
}

void WebServer::register_decision_routes() {
  server_->Post("/api/v1/decide", [this](const httplib::Request &req,
                                         httplib::Response &res) {
    auto body = parse_body(req, res);
    if (!body)
      return;
    if (!body->contains("url") || !(*body)["url"].is_string()) {
      reply(res, 400, {{"error", "missing string field 'url'"}});
      return;
    }
    Verdict verdict = engine_.decide((*body)["url"].get<std::string>());
    reply(res, 200, JsonFormatter::verdict_to_json(verdict));
  });

  server_->Post("/api/v1/decide/metadata", [this](const httplib::Request &req,
                                                  httplib::Response &res) {
    auto body = parse_body(req, res);
    if (!body)
      return;
    const json &document =
        body->contains("metadata") ? (*body)["metadata"] : *body;
    PageMetadata metadata = page_metadata_from_json(document);
    if (metadata.url.empty()) {
      reply(res, 400, {{"error", "metadata must carry a 'url'"}});
      return;
    }
    Verdict verdict = engine_.decide_with_metadata(std::move(metadata));
    reply(res, 200, JsonFormatter::verdict_to_json(verdict));
  });

  server_->Post("/api/v1/feedback", [this](const httplib::Request &req,
                                           httplib::Response &res) {
    auto body = parse_body(req, res);
    if (!body)
      return;
    if (!body->contains("url") || !(*body)["url"].is_string() ||
        !body->contains("correct") || !(*body)["correct"].is_boolean()) {
      reply(res, 400, {{"error", "expected {url: string, correct: bool}"}});
      return;
    }
    bool recorded = engine_.submit_feedback((*body)["url"].get<std::string>(),
                                            (*body)["correct"].get<bool>());
    reply(res, recorded ? 200 : 404, {{"recorded", recorded}});
  });
}

void WebServer::register_session_routes() {
  server_->Post("/api/v1/session/start", [this](const httplib::Request &req,
                                                httplib::Response &res) {
    auto body = parse_body(req, res);
    if (!body)
      return;
    if (!body->contains("duration_hours") ||
        !(*body)["duration_hours"].is_number()) {
      reply(res, 400, {{"error", "missing numeric field 'duration_hours'"}});
      return;
    }
    double hours = (*body)["duration_hours"].get<double>();
    std::string task = body->value("task", std::string("Focus Session"));
    if (!(hours > 0.0) || !(hours <= SessionSupervisor::MAX_DURATION_HOURS)) {
      reply(res, 400,
            {{"error", "duration_hours must be in (0, " +
                           std::to_string(static_cast<int>(
                               SessionSupervisor::MAX_DURATION_HOURS)) +
                           "]"}});
      return;
    }
    if (supervisor_.state() != SessionState::IDLE) {
      reply(res, 409, {{"error", "a session is already active"}});
      return;
    }

    auto secret = supervisor_.start_session(hours, task);
    if (!secret) {
      reply(res, 500, {{"error", "session could not be started"}});
      return;
    }
    reply(res, 200,
          {{"secret", secret->secret},
           {"fragments", secret->fragments},
           {"status", session_status_to_json(supervisor_.status())}});
  });

  server_->Post("/api/v1/session/end", [this](const httplib::Request &req,
                                              httplib::Response &res) {
    auto body = parse_body(req, res);
    if (!body)
      return;
    if (supervisor_.state() != SessionState::ACTIVE) {
      reply(res, 409, {{"unlocked", false}, {"error", "no active session"}});
      return;
    }

    bool unlocked = false;
    if (body->contains("secret") && (*body)["secret"].is_string()) {
      unlocked = supervisor_.end_session((*body)["secret"].get<std::string>());
    } else if (body->contains("fragments") &&
               (*body)["fragments"].is_array() &&
               (*body)["fragments"].size() == 3) {
      const json &f = (*body)["fragments"];
      if (!f[0].is_string() || !f[1].is_string() || !f[2].is_string()) {
        reply(res, 400, {{"error", "fragments must be strings"}});
        return;
      }
      unlocked = supervisor_.end_session_with_fragments(
          f[0].get<std::string>(), f[1].get<std::string>(),
          f[2].get<std::string>());
    } else {
      reply(res, 400, {{"error", "expected 'secret' or three 'fragments'"}});
      return;
    }
    reply(res, unlocked ? 200 : 403, {{"unlocked", unlocked}});
  });

  server_->Get("/api/v1/session/status",
               [this](const httplib::Request &, httplib::Response &res) {
                 json body = session_status_to_json(supervisor_.status());
                 auto outcome = supervisor_.last_outcome();
                 body["last_outcome"] =
                     outcome ? json(session_state_to_string(*outcome))
                             : json(nullptr);
                 reply(res, 200, body);
               });
}

void WebServer::register_admin_routes() {
  server_->Get("/api/v1/stats",
               [this](const httplib::Request &, httplib::Response &res) {
                 reply(res, 200,
                       engine_statistics_to_json(engine_.statistics()));
               });

  server_->Get("/api/v1/decisions/recent", [this](const httplib::Request &req,
                                                  httplib::Response &res) {
    size_t limit = 50;
    if (req.has_param("limit")) {
      if (auto parsed =
              Utils::string_to_number<size_t>(req.get_param_value("limit")))
        limit = *parsed;
    }
    json entries = json::array();
    for (const auto &entry : engine_.recent_verdicts(limit))
      entries.push_back(JsonFormatter::verdict_log_entry_to_json(entry));
    reply(res, 200, entries);
  });

  server_->Post("/api/v1/cache/clear",
                [this](const httplib::Request &, httplib::Response &res) {
                  size_t dropped = engine_.cache_size();
                  engine_.clear_cache();
                  reply(res, 200, {{"cleared", dropped}});
                });

  server_->Post("/api/v1/mission", [this](const httplib::Request &req,
                                          httplib::Response &res) {
    auto body = parse_body(req, res);
    if (!body)
      return;
    std::optional<Mission> mission = mission_from_json(*body);
    if (!mission) {
      reply(res, 400, {{"error", "mission document needs non-empty text"}});
      return;
    }
    json stored = mission_to_json(*mission);
    if (!Utils::write_file_atomically(config_.mission_path, stored.dump(2)))
      LOG(LogLevel::WARN, LogComponent::IO_WEB,
          "Mission applied but not saved to " << config_.mission_path);
    engine_.set_mission(std::move(*mission));
    reply(res, 200, stored);
  });
}

WebServer::~WebServer() { stop(); }

void WebServer::start() {
  if (server_thread_.joinable())
    return; // Already running
  server_thread_ = std::thread(&WebServer::run, this);
}

void WebServer::stop() {
  if (server_)
    server_->stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
    LOG(LogLevel::INFO, LogComponent::IO_WEB, "Web server stopped.");
  }
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server starting on a background thread...");
  if (!server_->listen(config_.web_server.host.c_str(),
                       config_.web_server.port)) {
    LOG(LogLevel::FATAL, LogComponent::IO_WEB,
        "Web server failed to listen on " << config_.web_server.host << ":"
                                          << config_.web_server.port);
  }
}
