#include "io/db/mongo_decision_store.hpp"
#include "core/logger.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>
#include <cstring>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/find_one_and_update.hpp>

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace {

Decision decision_from_view(bsoncxx::document::view view) {
  Decision decision;
  decision.id = view["_id"].get_oid().value.to_string();
  decision.url = std::string(view["url"].get_string().value);
  decision.mission = std::string(view["mission"].get_string().value);

  auto features = view["features"].get_binary();
  decision.features.resize(features.size / sizeof(double));
  std::memcpy(decision.features.data(), features.bytes,
              decision.features.size() * sizeof(double));

  decision.action = std::string(view["action"].get_string().value) == "BLOCK"
                        ? AdmissionAction::BLOCK
                        : AdmissionAction::ALLOW;
  decision.confidence = view["confidence"].get_double().value;
  decision.timestamp_ms =
      static_cast<uint64_t>(view["timestamp_ms"].get_int64().value);

  if (auto feedback = view["feedback"])
    decision.feedback = feedback.get_bool().value;
  if (auto reward = view["reward"])
    decision.reward = reward.get_double().value;
  return decision;
}

} // namespace

MongoDecisionStore::MongoDecisionStore(MongoManager &mongo,
                                       std::string database,
                                       std::string collection)
    : mongo_(mongo), database_(std::move(database)),
      collection_(std::move(collection)) {
  ensure_indexes();
}

void MongoDecisionStore::ensure_indexes() {
  try {
    auto client = mongo_.get_client();
    auto collection = (*client)[database_][collection_];
    collection.create_index(make_document(
        kvp("url", 1), kvp("mission", 1), kvp("timestamp_ms", -1)));
    LOG(LogLevel::DEBUG, LogComponent::IO_DATABASE,
        "Ensured feedback index on " << database_ << "." << collection_);
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::IO_DATABASE,
        "Could not create decision index: " << e.what());
  }
}

bool MongoDecisionStore::append(const Decision &decision) {
  try {
    bsoncxx::types::b_binary features{
        bsoncxx::binary_sub_type::k_binary,
        static_cast<uint32_t>(decision.features.size() * sizeof(double)),
        reinterpret_cast<const uint8_t *>(decision.features.data())};

    auto client = mongo_.get_client();
    auto collection = (*client)[database_][collection_];
    auto result = collection.insert_one(make_document(
        kvp("url", decision.url), kvp("mission", decision.mission),
        kvp("features", features),
        kvp("action", std::string(action_to_string(decision.action))),
        kvp("confidence", decision.confidence),
        kvp("timestamp_ms", static_cast<int64_t>(decision.timestamp_ms))));
    if (!result) {
      LOG(LogLevel::ERROR, LogComponent::IO_DATABASE,
          "Insert of decision for " << decision.url
                                    << " was not acknowledged.");
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DATABASE,
        "Failed to record decision for " << decision.url << ": "
                                         << e.what());
    return false;
  }
}

std::optional<Decision>
MongoDecisionStore::attach_feedback(const std::string &url,
                                    const std::string &mission,
                                    bool correct) {
  try {
    mongocxx::options::find_one_and_update options;
    options.sort(make_document(kvp("timestamp_ms", -1)));
    options.return_document(mongocxx::options::return_document::k_after);

    auto client = mongo_.get_client();
    auto collection = (*client)[database_][collection_];
    auto updated = collection.find_one_and_update(
        make_document(kvp("url", url), kvp("mission", mission),
                      kvp("feedback", make_document(kvp("$exists", false)))),
        make_document(kvp("$set", make_document(kvp("feedback", correct),
                                                kvp("reward", correct ? 1.0
                                                                      : -1.0)))),
        options);
    if (!updated)
      return std::nullopt;
    return decision_from_view(updated->view());
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DATABASE,
        "Failed to attach feedback for " << url << ": " << e.what());
    return std::nullopt;
  }
}

std::vector<Decision> MongoDecisionStore::recent(size_t limit) {
  std::vector<Decision> result;
  try {
    mongocxx::options::find options;
    options.sort(make_document(kvp("timestamp_ms", -1)));
    options.limit(static_cast<int64_t>(limit));

    auto client = mongo_.get_client();
    auto collection = (*client)[database_][collection_];
    for (auto &&doc : collection.find(make_document(), options))
      result.push_back(decision_from_view(doc));
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DATABASE,
        "Failed to read recent decisions: " << e.what());
  }
  return result;
}
