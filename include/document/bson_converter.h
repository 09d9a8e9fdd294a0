#ifndef BSON_CONVERTER_H
#define BSON_CONVERTER_H

#include "document/document.h"
#include <bson/bson.h>
#include <memory>
#include <stdexcept>
#include <string>

// Owning bson_t pointer.
class BsonDocument {
private:
  std::unique_ptr<bson_t, decltype(&bson_destroy)> bson_;

public:
  BsonDocument() : bson_(bson_new(), bson_destroy) {}
  explicit BsonDocument(bson_t *bson) : bson_(bson, bson_destroy) {}

  BsonDocument(BsonDocument &&other) noexcept = default;
  BsonDocument &operator=(BsonDocument &&other) noexcept = default;

  BsonDocument(const BsonDocument &) = delete;
  BsonDocument &operator=(const BsonDocument &) = delete;

  bson_t *get() const noexcept { return bson_.get(); }
  bson_t *release() noexcept { return bson_.release(); }

  bool is_valid() const noexcept { return bson_ != nullptr; }
  operator bool() const noexcept { return is_valid(); }
};

class BsonConversionError : public std::runtime_error {
public:
  explicit BsonConversionError(const std::string &message)
      : std::runtime_error(message) {}
};

// Converts between the document model and libbson documents. BSON types
// the model has no counterpart for (regular expressions, JavaScript code,
// symbols, min/max keys, undefined, DBPointer) are read as strings and
// logged.
class BsonConverter {
public:
  static BsonDocument toBson(const Document &document);
  static Document fromBson(const bson_t *bson);

  // Parses extended JSON with libbson. An empty string yields an empty
  // document.
  static BsonDocument fromJson(const std::string &json);
};

#endif
