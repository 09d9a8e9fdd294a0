#ifndef MONGODB_ENGINE_H
#define MONGODB_ENGINE_H

#include "core/logger.h"
#include <bson/bson.h>
#include <cstdint>
#include <memory>
#include <mongoc/mongoc.h>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Components of a mongodb:// or mongodb+srv:// URI. database is empty when
// the URI has no path.
struct MongoUriInfo {
  std::string host;
  int port = 27017;
  std::string database;
  bool srv = false;
};

// One client connection to a MongoDB deployment, pinged on construction.
// A single engine is shared by the source and sink of a job, which run on
// the same worker thread.
class MongoDBEngine {
  std::string connectionString_;
  mongoc_client_t *client_;
  MongoUriInfo uri_;
  bool valid_;
  std::string lastError_;
  mutable std::mutex clientMutex_;

public:
  explicit MongoDBEngine(std::string connectionString);
  ~MongoDBEngine();

  MongoDBEngine(const MongoDBEngine &) = delete;
  MongoDBEngine &operator=(const MongoDBEngine &) = delete;

  static std::optional<MongoUriInfo>
  parseConnectionString(const std::string &connectionString);

  bool isValid() const { return valid_ && client_ != nullptr; }
  const std::string &lastError() const { return lastError_; }
  mongoc_client_t *getClient() const { return client_; }
  const MongoUriInfo &uri() const { return uri_; }

  // Collection names of the database in name order, without system.*.
  std::vector<std::string> listCollections(const std::string &database);

  // Uses the collection metadata when filter is null, a counted query
  // otherwise. nullopt when the server could not answer.
  std::optional<uint64_t> estimatedCount(const std::string &database,
                                         const std::string &collection,
                                         const bson_t *filter = nullptr);

  // Recreates every secondary index of the source collection on the target
  // collection. Returns the number of indexes created.
  size_t copyIndexes(const std::string &database,
                     const std::string &collection, MongoDBEngine &target,
                     const std::string &targetDatabase,
                     const std::string &targetCollection);

private:
  bool connect();
  void disconnect();
};

#endif
