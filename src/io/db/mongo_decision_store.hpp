#ifndef MONGO_DECISION_STORE_HPP
#define MONGO_DECISION_STORE_HPP

#include "io/db/decision_store.hpp"
#include "io/db/mongo_manager.hpp"

#include <string>

// One document per decision. The feature vector is kept as a BSON binary
// blob of host-order doubles.
class MongoDecisionStore : public IDecisionStore {
public:
  MongoDecisionStore(MongoManager &mongo, std::string database,
                     std::string collection);

  bool append(const Decision &decision) override;
  std::optional<Decision> attach_feedback(const std::string &url,
                                          const std::string &mission,
                                          bool correct) override;
  std::vector<Decision> recent(size_t limit) override;
  std::string backend_name() const override { return "mongodb"; }

private:
  void ensure_indexes();

  MongoManager &mongo_;
  std::string database_;
  std::string collection_;
};

#endif // MONGO_DECISION_STORE_HPP
