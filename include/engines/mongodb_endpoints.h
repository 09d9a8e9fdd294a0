#ifndef MONGODB_ENDPOINTS_H
#define MONGODB_ENDPOINTS_H

#include "document/bson_converter.h"
#include "engines/mongodb_engine.h"
#include "transfer/document_sink.h"
#include "transfer/document_source.h"
#include "transfer/transfer_job.h"
#include <memory>
#include <string>

// Reads a collection through a server cursor. filter, projection and sort
// are extended JSON; open(offset) skips on the server.
class MongoCollectionSource : public IDocumentSource {
public:
  MongoCollectionSource(std::shared_ptr<MongoDBEngine> engine,
                        std::string database, std::string collection,
                        std::string filter = "", std::string projection = "",
                        std::string sort = "");

  std::unique_ptr<DocumentCursor> open(uint64_t offset) override;
  std::optional<uint64_t> estimatedCount() override;
  std::string describe() const override { return database_ + "." + collection_; }

private:
  std::shared_ptr<MongoDBEngine> engine_;
  std::string database_;
  std::string collection_;
  BsonDocument filter_;
  BsonDocument projection_;
  BsonDocument sort_;
};

// Writes each batch as one unordered bulk operation. INSERT inserts,
// UPSERT merges the document's fields into a matching _id with $set, and
// REPLACE swaps the whole document; both create it when missing.
// Documents without _id are always inserted.
class MongoCollectionSink : public IDocumentSink {
public:
  MongoCollectionSink(std::shared_ptr<MongoDBEngine> engine,
                      std::string database, std::string collection,
                      InsertMode mode);
  ~MongoCollectionSink() override;

  void open(const ColumnSchema *schema) override;
  BatchWriteResult writeBatch(const std::vector<Document> &documents) override;
  void close() override;
  std::string describe() const override { return database_ + "." + collection_; }

private:
  std::shared_ptr<MongoDBEngine> engine_;
  std::string database_;
  std::string collection_;
  InsertMode mode_;
  mongoc_collection_t *coll_;
};

#endif
