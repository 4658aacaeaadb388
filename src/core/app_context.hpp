#ifndef APP_CONTEXT_HPP
#define APP_CONTEXT_HPP

#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "detection/decision_engine.hpp"
#include "io/db/decision_store.hpp"
#include "io/db/mongo_manager.hpp"
#include "io/metadata/bounded_metadata_source.hpp"
#include "io/web/web_server.hpp"
#include "models/model_manager.hpp"
#include "session/enforcement_process.hpp"
#include "session/session_store.hpp"
#include "session/session_supervisor.hpp"

#include <memory>

// Builds every daemon component once, in dependency order, and tears them
// down in reverse. Components receive their collaborators by reference.
class AppContext {
public:
  explicit AppContext(std::shared_ptr<const Config::AppConfig> config);
  ~AppContext();

  AppContext(const AppContext &) = delete;
  AppContext &operator=(const AppContext &) = delete;

  const Config::AppConfig &config() const { return *config_; }
  MetricsRegistry &metrics() { return metrics_; }
  DecisionEngine &engine() { return *engine_; }
  SessionSupervisor &supervisor() { return *supervisor_; }

  void start_web_server();

private:
  std::unique_ptr<IDecisionStore> make_decision_store();

  std::shared_ptr<const Config::AppConfig> config_;
  MetricsRegistry metrics_;

  std::unique_ptr<MongoManager> mongo_;
  std::unique_ptr<IDecisionStore> store_;
  std::unique_ptr<ModelManager> models_;
  std::unique_ptr<BoundedMetadataSource> metadata_source_;
  std::unique_ptr<DecisionEngine> engine_;

  std::unique_ptr<PosixEnforcementProcess> process_;
  std::unique_ptr<SessionStore> session_store_;
  std::unique_ptr<SessionSupervisor> supervisor_;

  std::unique_ptr<WebServer> web_server_;
};

#endif // APP_CONTEXT_HPP
