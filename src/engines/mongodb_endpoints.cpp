#include "engines/mongodb_endpoints.h"
#include "core/logger.h"
#include "engines/mongodb_resource_wrappers.h"
#include <algorithm>

namespace {

constexpr int32_t DUPLICATE_KEY_ERROR = 11000;

BsonDocument parseOption(const std::string &json, const char *what) {
  try {
    return BsonConverter::fromJson(json);
  } catch (const BsonConversionError &e) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        std::string("invalid ") + what + ": " + e.what());
  }
}

class MongoCursor : public DocumentCursor {
public:
  MongoCursor(std::shared_ptr<MongoDBEngine> engine, mongoc_collection_t *coll,
              mongoc_cursor_t *cursor, std::string name)
      : engine_(std::move(engine)), coll_(coll), cursor_(cursor),
        name_(std::move(name)) {}

  ~MongoCursor() override {
    mongoc_cursor_destroy(cursor_);
    mongoc_collection_destroy(coll_);
  }

  MongoCursor(const MongoCursor &) = delete;
  MongoCursor &operator=(const MongoCursor &) = delete;

  bool next(ReadItem &item) override {
    const bson_t *doc;
    if (mongoc_cursor_next(cursor_, &doc)) {
      item = ReadItem();
      try {
        item.document = BsonConverter::fromBson(doc);
      } catch (const BsonConversionError &e) {
        RecordError error;
        error.kind = RecordErrorKind::NOT_A_DOCUMENT;
        error.message = e.what();
        item.error = std::move(error);
      }
      return true;
    }

    bson_error_t error;
    if (mongoc_cursor_error(cursor_, &error)) {
      throw TransferError(TransferErrorKind::SOURCE_UNAVAILABLE,
                          "cursor on " + name_ +
                              " failed: " + std::string(error.message));
    }
    return false;
  }

private:
  std::shared_ptr<MongoDBEngine> engine_;
  mongoc_collection_t *coll_;
  mongoc_cursor_t *cursor_;
  std::string name_;
};

} // namespace

MongoCollectionSource::MongoCollectionSource(
    std::shared_ptr<MongoDBEngine> engine, std::string database,
    std::string collection, std::string filter, std::string projection,
    std::string sort)
    : engine_(std::move(engine)), database_(std::move(database)),
      collection_(std::move(collection)),
      filter_(parseOption(filter, "filter")),
      projection_(parseOption(projection, "projection")),
      sort_(parseOption(sort, "sort")) {}

std::unique_ptr<DocumentCursor> MongoCollectionSource::open(uint64_t offset) {
  if (!engine_ || !engine_->isValid()) {
    throw TransferError(TransferErrorKind::SOURCE_UNAVAILABLE,
                        "no connection for " + describe());
  }

  bson_t opts;
  bson_init(&opts);
  if (!bson_empty(projection_.get()))
    BSON_APPEND_DOCUMENT(&opts, "projection", projection_.get());
  if (!bson_empty(sort_.get()))
    BSON_APPEND_DOCUMENT(&opts, "sort", sort_.get());
  if (offset > 0)
    BSON_APPEND_INT64(&opts, "skip", static_cast<int64_t>(offset));

  mongoc_collection_t *coll = mongoc_client_get_collection(
      engine_->getClient(), database_.c_str(), collection_.c_str());
  mongoc_cursor_t *cursor =
      mongoc_collection_find_with_opts(coll, filter_.get(), &opts, nullptr);
  bson_destroy(&opts);

  Logger::debug(LogCategory::DATABASE, "MongoCollectionSource::open",
                "Opened cursor on " + describe() + " at offset " +
                    std::to_string(offset));
  return std::make_unique<MongoCursor>(engine_, coll, cursor, describe());
}

std::optional<uint64_t> MongoCollectionSource::estimatedCount() {
  if (!engine_)
    return std::nullopt;
  return engine_->estimatedCount(database_, collection_, filter_.get());
}

MongoCollectionSink::MongoCollectionSink(std::shared_ptr<MongoDBEngine> engine,
                                         std::string database,
                                         std::string collection,
                                         InsertMode mode)
    : engine_(std::move(engine)), database_(std::move(database)),
      collection_(std::move(collection)), mode_(mode), coll_(nullptr) {}

MongoCollectionSink::~MongoCollectionSink() {
  if (coll_) {
    mongoc_collection_destroy(coll_);
    coll_ = nullptr;
  }
}

void MongoCollectionSink::open(const ColumnSchema *) {
  if (!engine_ || !engine_->isValid()) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "no connection for " + describe());
  }
  coll_ = mongoc_client_get_collection(engine_->getClient(), database_.c_str(),
                                       collection_.c_str());
}

// Builds one bulk operation for the batch and attributes every entry of the
// reply's writeErrors to the batch position it came from. A failed execute
// without write errors means the server or connection is gone.
BatchWriteResult
MongoCollectionSink::writeBatch(const std::vector<Document> &documents) {
  if (!coll_) {
    throw TransferError(TransferErrorKind::INTERNAL,
                        describe() + " written before open");
  }

  BatchWriteResult result;
  std::vector<size_t> operationIndex;
  operationIndex.reserve(documents.size());

  BsonDocument bulkOpts(BCON_NEW("ordered", BCON_BOOL(false)));
  MongoBulkOperation bulk(
      mongoc_collection_create_bulk_operation_with_opts(coll_, bulkOpts.get()));
  BsonDocument upsertOpts(BCON_NEW("upsert", BCON_BOOL(true)));

  for (size_t i = 0; i < documents.size(); ++i) {
    const Document &document = documents[i];
    bson_error_t error;
    bool queued;

    try {
      if (mode_ == InsertMode::INSERT || !document.contains("_id")) {
        BsonDocument doc = BsonConverter::toBson(document);
        queued = mongoc_bulk_operation_insert_with_opts(bulk.get(), doc.get(),
                                                        nullptr, &error);
      } else {
        Document selector;
        selector.set("_id", *document.get("_id"));
        BsonDocument selectorBson = BsonConverter::toBson(selector);

        if (mode_ == InsertMode::UPSERT) {
          Document fields = document;
          fields.remove("_id");
          Document update;
          update.set("$set", Value(std::move(fields)));
          BsonDocument updateBson = BsonConverter::toBson(update);
          queued = mongoc_bulk_operation_update_one_with_opts(
              bulk.get(), selectorBson.get(), updateBson.get(),
              upsertOpts.get(), &error);
        } else {
          BsonDocument doc = BsonConverter::toBson(document);
          queued = mongoc_bulk_operation_replace_one_with_opts(
              bulk.get(), selectorBson.get(), doc.get(), upsertOpts.get(),
              &error);
        }
      }
    } catch (const BsonConversionError &e) {
      result.failures.push_back({i, RecordErrorKind::ENCODE_FAILED, e.what()});
      continue;
    }

    if (!queued) {
      result.failures.push_back(
          {i, RecordErrorKind::WRITE_FAILED, std::string(error.message)});
      continue;
    }
    operationIndex.push_back(i);
  }

  if (operationIndex.empty())
    return result;

  BsonReply reply;
  bson_error_t error;
  uint32_t ok = mongoc_bulk_operation_execute(bulk.get(), reply.out(), &error);

  Document replyDoc;
  try {
    replyDoc = BsonConverter::fromBson(reply.get());
  } catch (const BsonConversionError &e) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "unreadable bulk write reply from " + describe() +
                            ": " + e.what());
  }

  size_t writeErrors = 0;
  const Value *errors = replyDoc.get("writeErrors");
  if (errors && errors->type() == ValueType::ARRAY) {
    for (const auto &entry : errors->asArray()) {
      if (entry.type() != ValueType::DOCUMENT)
        continue;
      const Document &writeError = entry.asDocument();
      const Value *index = writeError.get("index");
      const Value *code = writeError.get("code");
      const Value *message = writeError.get("errmsg");
      if (!index || index->type() != ValueType::INT32 ||
          index->asInt32() < 0 ||
          static_cast<size_t>(index->asInt32()) >= operationIndex.size())
        continue;

      bool duplicate = code && code->type() == ValueType::INT32 &&
                       code->asInt32() == DUPLICATE_KEY_ERROR;
      result.failures.push_back(
          {operationIndex[static_cast<size_t>(index->asInt32())],
           duplicate ? RecordErrorKind::INSERT_CONFLICT
                     : RecordErrorKind::WRITE_FAILED,
           message && message->type() == ValueType::STRING
               ? message->asString()
               : std::string("write failed")});
      ++writeErrors;
    }
  }

  if (!ok && writeErrors == 0) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "bulk write to " + describe() +
                            " failed: " + std::string(error.message));
  }

  const Value *concern = replyDoc.get("writeConcernErrors");
  if (concern && concern->type() == ValueType::ARRAY &&
      !concern->asArray().empty()) {
    Logger::warning(LogCategory::DATABASE, "MongoCollectionSink::writeBatch",
                    "Write concern errors on " + describe());
  }

  std::sort(result.failures.begin(), result.failures.end(),
            [](const RecordFailure &a, const RecordFailure &b) {
              return a.index < b.index;
            });
  result.written = operationIndex.size() - writeErrors;
  return result;
}

void MongoCollectionSink::close() {
  if (coll_) {
    mongoc_collection_destroy(coll_);
    coll_ = nullptr;
  }
}
