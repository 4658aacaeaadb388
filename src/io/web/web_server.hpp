#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "detection/decision_engine.hpp"
#include "httplib.h"
#include "session/session_supervisor.hpp"

#include <memory>
#include <string>
#include <thread>

// Daemon-local JSON API for the proxy collaborator and the CLI, plus
// /metrics and /health
class WebServer {
public:
  WebServer(const Config::AppConfig &config, MetricsRegistry &metrics_registry,
            DecisionEngine &engine, SessionSupervisor &supervisor);
  ~WebServer();

  void start();
  void stop();

private:
  void register_decision_routes();
  void register_session_routes();
  void register_admin_routes();
  void run();

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  Config::AppConfig config_;
  MetricsRegistry &metrics_registry_;
  DecisionEngine &engine_;
  SessionSupervisor &supervisor_;
};

#endif // WEB_SERVER_HPP
