#include "engines/mongodb_engine.h"
#include "transfer/transfer_errors.h"
#include "utils/string_utils.h"
#include <algorithm>

MongoDBEngine::MongoDBEngine(std::string connectionString)
    : connectionString_(std::move(connectionString)), client_(nullptr),
      valid_(false) {
  auto parsed = parseConnectionString(connectionString_);
  if (parsed) {
    uri_ = *parsed;
    valid_ = connect();
  } else {
    lastError_ = "invalid MongoDB connection string";
    Logger::error(LogCategory::DATABASE, "MongoDBEngine",
                  "Failed to parse connection string " +
                      StringUtils::maskConnectionString(connectionString_));
  }
}

MongoDBEngine::~MongoDBEngine() { disconnect(); }

std::optional<MongoUriInfo>
MongoDBEngine::parseConnectionString(const std::string &connectionString) {
  MongoUriInfo info;
  size_t hostStart;
  if (StringUtils::startsWith(connectionString, "mongodb://")) {
    hostStart = std::string("mongodb://").size();
  } else if (StringUtils::startsWith(connectionString, "mongodb+srv://")) {
    hostStart = std::string("mongodb+srv://").size();
    info.srv = true;
  } else {
    return std::nullopt;
  }

  size_t authorityEnd = connectionString.find_first_of("/?", hostStart);
  if (authorityEnd == std::string::npos)
    authorityEnd = connectionString.size();

  size_t atPos = connectionString.rfind('@', authorityEnd);
  if (atPos != std::string::npos && atPos >= hostStart)
    hostStart = atPos + 1;

  std::string hosts =
      connectionString.substr(hostStart, authorityEnd - hostStart);
  if (hosts.empty())
    return std::nullopt;

  // The first host of a seed list names the deployment in log lines.
  std::string first = hosts.substr(0, hosts.find(','));
  size_t colonPos = first.rfind(':');
  if (colonPos != std::string::npos && first.find(']') == std::string::npos) {
    info.host = first.substr(0, colonPos);
    std::string portStr = first.substr(colonPos + 1);
    if (portStr.empty() || portStr.size() > 5 ||
        portStr.find_first_not_of("0123456789") != std::string::npos) {
      return std::nullopt;
    }
    info.port = std::stoi(portStr);
    if (info.port <= 0 || info.port > 65535)
      return std::nullopt;
  } else {
    info.host = first;
  }
  if (info.host.empty())
    return std::nullopt;

  if (authorityEnd < connectionString.size() &&
      connectionString[authorityEnd] == '/') {
    size_t dbEnd = connectionString.find('?', authorityEnd);
    if (dbEnd == std::string::npos)
      dbEnd = connectionString.size();
    info.database =
        connectionString.substr(authorityEnd + 1, dbEnd - authorityEnd - 1);
  }
  return info;
}

bool MongoDBEngine::connect() {
  static std::once_flag initFlag;
  std::call_once(initFlag, []() { mongoc_init(); });

  bson_error_t error;
  mongoc_uri_t *uri = mongoc_uri_new_with_error(connectionString_.c_str(),
                                                &error);
  if (!uri) {
    lastError_ = error.message;
    Logger::error(LogCategory::DATABASE, "MongoDBEngine",
                  "Invalid MongoDB URI: " + lastError_);
    return false;
  }
  client_ = mongoc_client_new_from_uri(uri);
  mongoc_uri_destroy(uri);

  if (!client_) {
    lastError_ = "failed to create MongoDB client";
    Logger::error(LogCategory::DATABASE, "MongoDBEngine",
                  "Failed to create MongoDB client");
    return false;
  }

  mongoc_client_set_error_api(client_, MONGOC_ERROR_API_VERSION_2);
  mongoc_client_set_appname(client_, "DocTransfer");

  bson_t *ping = BCON_NEW("ping", BCON_INT32(1));
  bool ret = mongoc_client_command_simple(client_, "admin", ping, nullptr,
                                          nullptr, &error);
  bson_destroy(ping);

  if (!ret) {
    lastError_ = error.message;
    Logger::error(LogCategory::DATABASE, "MongoDBEngine",
                  "Failed to ping MongoDB: " + lastError_);
    mongoc_client_destroy(client_);
    client_ = nullptr;
    return false;
  }

  Logger::info(LogCategory::DATABASE, "MongoDBEngine",
               "Connected to MongoDB: " + uri_.host + ":" +
                   std::to_string(uri_.port));
  return true;
}

void MongoDBEngine::disconnect() {
  if (client_) {
    mongoc_client_destroy(client_);
    client_ = nullptr;
  }
}

std::vector<std::string>
MongoDBEngine::listCollections(const std::string &database) {
  if (!isValid()) {
    throw TransferError(TransferErrorKind::SOURCE_UNAVAILABLE,
                        "cannot list collections: " + lastError_);
  }

  std::lock_guard<std::mutex> lock(clientMutex_);
  mongoc_database_t *db = mongoc_client_get_database(client_, database.c_str());
  bson_error_t error;
  char **names = mongoc_database_get_collection_names_with_opts(db, nullptr,
                                                                &error);
  mongoc_database_destroy(db);

  if (!names) {
    throw TransferError(TransferErrorKind::SOURCE_UNAVAILABLE,
                        "failed to list collections of " + database + ": " +
                            std::string(error.message));
  }

  std::vector<std::string> collections;
  for (size_t i = 0; names[i]; ++i) {
    std::string name = names[i];
    if (!StringUtils::startsWith(name, "system."))
      collections.push_back(std::move(name));
  }
  bson_strfreev(names);
  std::sort(collections.begin(), collections.end());

  Logger::info(LogCategory::DATABASE, "MongoDBEngine::listCollections",
               "Found " + std::to_string(collections.size()) +
                   " collections in database " + database);
  return collections;
}

std::optional<uint64_t>
MongoDBEngine::estimatedCount(const std::string &database,
                              const std::string &collection,
                              const bson_t *filter) {
  if (!isValid())
    return std::nullopt;

  std::lock_guard<std::mutex> lock(clientMutex_);
  mongoc_collection_t *coll = mongoc_client_get_collection(
      client_, database.c_str(), collection.c_str());
  bson_error_t error;
  int64_t count;
  if (filter && !bson_empty(filter)) {
    count = mongoc_collection_count_documents(coll, filter, nullptr, nullptr,
                                              nullptr, &error);
  } else {
    count = mongoc_collection_estimated_document_count(coll, nullptr, nullptr,
                                                       nullptr, &error);
  }
  mongoc_collection_destroy(coll);

  if (count < 0) {
    Logger::warning(LogCategory::DATABASE, "MongoDBEngine::estimatedCount",
                    "Error counting documents in " + database + "." +
                        collection + ": " + std::string(error.message));
    return std::nullopt;
  }
  return static_cast<uint64_t>(count);
}

// Reads the index specifications of the source collection and sends them to
// the target in one createIndexes command. The _id index always exists and
// is skipped; "v" and "ns" describe the source and are left out.
size_t MongoDBEngine::copyIndexes(const std::string &database,
                                  const std::string &collection,
                                  MongoDBEngine &target,
                                  const std::string &targetDatabase,
                                  const std::string &targetCollection) {
  if (!isValid() || !target.isValid()) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "cannot copy indexes without a connection");
  }

  bson_t indexes;
  bson_init(&indexes);
  size_t count = 0;

  {
    std::lock_guard<std::mutex> lock(clientMutex_);
    mongoc_collection_t *coll = mongoc_client_get_collection(
        client_, database.c_str(), collection.c_str());
    mongoc_cursor_t *cursor =
        mongoc_collection_find_indexes_with_opts(coll, nullptr);

    const bson_t *spec;
    while (mongoc_cursor_next(cursor, &spec)) {
      bson_iter_t iter;
      if (bson_iter_init_find(&iter, spec, "name") &&
          BSON_ITER_HOLDS_UTF8(&iter) &&
          std::string(bson_iter_utf8(&iter, nullptr)) == "_id_") {
        continue;
      }

      bson_t entry;
      char keyBuf[16];
      const char *key = nullptr;
      bson_uint32_to_string(static_cast<uint32_t>(count), &key, keyBuf,
                            sizeof(keyBuf));
      bson_init(&entry);
      bson_copy_to_excluding_noinit(spec, &entry, "v", "ns", NULL);
      bson_append_document(&indexes, key, -1, &entry);
      bson_destroy(&entry);
      ++count;
    }

    bson_error_t error;
    bool failed = mongoc_cursor_error(cursor, &error);
    mongoc_cursor_destroy(cursor);
    mongoc_collection_destroy(coll);
    if (failed) {
      bson_destroy(&indexes);
      throw TransferError(TransferErrorKind::SOURCE_UNAVAILABLE,
                          "failed to read indexes of " + database + "." +
                              collection + ": " + std::string(error.message));
    }
  }

  if (count == 0) {
    bson_destroy(&indexes);
    return 0;
  }

  bson_t command;
  bson_init(&command);
  BSON_APPEND_UTF8(&command, "createIndexes", targetCollection.c_str());
  BSON_APPEND_ARRAY(&command, "indexes", &indexes);

  bson_error_t error;
  bool ok;
  {
    std::lock_guard<std::mutex> lock(target.clientMutex_);
    ok = mongoc_client_write_command_with_opts(
        target.client_, targetDatabase.c_str(), &command, nullptr, nullptr,
        &error);
  }
  bson_destroy(&command);
  bson_destroy(&indexes);

  if (!ok) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "failed to create indexes on " + targetDatabase + "." +
                            targetCollection + ": " +
                            std::string(error.message));
  }

  Logger::info(LogCategory::DATABASE, "MongoDBEngine::copyIndexes",
               "Copied " + std::to_string(count) + " indexes to " +
                   targetDatabase + "." + targetCollection);
  return count;
}
