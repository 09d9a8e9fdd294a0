#ifndef MONGODB_RESOURCE_WRAPPERS_H
#define MONGODB_RESOURCE_WRAPPERS_H

#include <bson/bson.h>
#include <memory>
#include <mongoc/mongoc.h>

// RAII wrapper for libmongoc bulk operations
class MongoBulkOperation {
private:
  std::unique_ptr<mongoc_bulk_operation_t,
                  decltype(&mongoc_bulk_operation_destroy)>
      bulk_;

public:
  explicit MongoBulkOperation(mongoc_bulk_operation_t *bulk)
      : bulk_(bulk, mongoc_bulk_operation_destroy) {}

  MongoBulkOperation(MongoBulkOperation &&other) noexcept = default;
  MongoBulkOperation &operator=(MongoBulkOperation &&other) noexcept = default;

  // Delete copy constructor and assignment
  MongoBulkOperation(const MongoBulkOperation &) = delete;
  MongoBulkOperation &operator=(const MongoBulkOperation &) = delete;

  mongoc_bulk_operation_t *get() const noexcept { return bulk_.get(); }

  bool is_valid() const noexcept { return bulk_ != nullptr; }
  operator bool() const noexcept { return is_valid(); }
};

// Owns a bson_t that libmongoc initializes in place, such as a command or
// bulk write reply. The reply is always initialized by the call that fills
// it, even on failure, so it is always destroyed.
class BsonReply {
private:
  bson_t reply_;

public:
  BsonReply() { bson_init(&reply_); }
  ~BsonReply() { bson_destroy(&reply_); }

  BsonReply(const BsonReply &) = delete;
  BsonReply &operator=(const BsonReply &) = delete;

  // For out-parameters. The function being called initializes it again, so
  // the empty document from the constructor is released first.
  bson_t *out() noexcept {
    bson_destroy(&reply_);
    return &reply_;
  }
  const bson_t *get() const noexcept { return &reply_; }
};

#endif
