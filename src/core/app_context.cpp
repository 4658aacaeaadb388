#include "core/app_context.hpp"
#include "core/logger.hpp"
#include "io/db/in_memory_decision_store.hpp"
#include "io/db/mongo_decision_store.hpp"
#include "io/metadata/http_metadata_fetcher.hpp"

AppContext::AppContext(std::shared_ptr<const Config::AppConfig> config)
    : config_(std::move(config)) {
  store_ = make_decision_store();
  models_ = std::make_unique<ModelManager>(config_->classifier);

  if (config_->metadata_fetch.enabled)
    metadata_source_ = std::make_unique<BoundedMetadataSource>(
        std::make_shared<HttpMetadataFetcher>(config_->metadata_fetch),
        config_->metadata_fetch);

  engine_ = std::make_unique<DecisionEngine>(*config_, *models_, *store_,
                                             metrics_, metadata_source_.get());

  process_ = std::make_unique<PosixEnforcementProcess>(config_->session);
  session_store_ = std::make_unique<SessionStore>(config_->session_record_path);
  supervisor_ = std::make_unique<SessionSupervisor>(
      *config_, *process_, *session_store_, metrics_, engine_.get());

  if (config_->web_server.enabled)
    web_server_ = std::make_unique<WebServer>(*config_, metrics_, *engine_,
                                              *supervisor_);
  LOG(LogLevel::INFO, LogComponent::CORE, "Application context ready.");
}

AppContext::~AppContext() {
  // The web server goes first so no request reaches a half-destroyed engine
  web_server_.reset();
  supervisor_.reset();
  engine_.reset();
  metadata_source_.reset();
}

void AppContext::start_web_server() {
  if (web_server_)
    web_server_->start();
}

std::unique_ptr<IDecisionStore> AppContext::make_decision_store() {
  const auto &cfg = config_->decision_store;
  if (cfg.backend == "mongodb") {
    mongo_ = std::make_unique<MongoManager>(cfg.mongo_uri);
    if (mongo_->ping()) {
      LOG(LogLevel::INFO, LogComponent::IO_DATABASE,
          "Recording decisions in MongoDB " << cfg.mongo_database << "."
                                            << cfg.mongo_collection);
      return std::make_unique<MongoDecisionStore>(*mongo_, cfg.mongo_database,
                                                  cfg.mongo_collection);
    }
    LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
        "MongoDB unavailable, recording decisions in memory instead.");
  }
  return std::make_unique<InMemoryDecisionStore>(cfg.memory_capacity);
}
