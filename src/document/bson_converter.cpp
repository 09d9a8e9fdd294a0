#include "document/bson_converter.h"
#include "core/logger.h"
#include <cstring>

namespace {

void appendValue(bson_t *target, const char *key, const Value &value);

void appendDocument(bson_t *target, const Document &document) {
  for (const auto &field : document.fields()) {
    appendValue(target, field.name.c_str(), field.value);
  }
}

void appendValue(bson_t *target, const char *key, const Value &value) {
  bool ok = true;
  switch (value.type()) {
  case ValueType::NULL_VALUE:
    ok = bson_append_null(target, key, -1);
    break;
  case ValueType::BOOLEAN:
    ok = bson_append_bool(target, key, -1, value.asBool());
    break;
  case ValueType::INT32:
    ok = bson_append_int32(target, key, -1, value.asInt32());
    break;
  case ValueType::INT64:
    ok = bson_append_int64(target, key, -1, value.asInt64());
    break;
  case ValueType::DOUBLE:
    ok = bson_append_double(target, key, -1, value.asDouble());
    break;
  case ValueType::STRING: {
    const std::string &text = value.asString();
    ok = bson_append_utf8(target, key, -1, text.data(),
                          static_cast<int>(text.size()));
    break;
  }
  case ValueType::DECIMAL128: {
    bson_decimal128_t dec;
    if (!bson_decimal128_from_string(value.asDecimal128().text.c_str(),
                                     &dec)) {
      throw BsonConversionError("invalid decimal128 value '" +
                                value.asDecimal128().text + "' in field " +
                                key);
    }
    ok = bson_append_decimal128(target, key, -1, &dec);
    break;
  }
  case ValueType::BINARY: {
    const Binary &bin = value.asBinary();
    ok = bson_append_binary(
        target, key, -1, static_cast<bson_subtype_t>(bin.subtype),
        bin.data.data(), static_cast<uint32_t>(bin.data.size()));
    break;
  }
  case ValueType::DATE_TIME:
    ok = bson_append_date_time(target, key, -1, value.asDateTime().millis);
    break;
  case ValueType::TIMESTAMP:
    ok = bson_append_timestamp(target, key, -1, value.asTimestamp().seconds,
                               value.asTimestamp().increment);
    break;
  case ValueType::OBJECT_ID: {
    bson_oid_t oid;
    bson_oid_init_from_data(&oid, value.asObjectId().bytes.data());
    ok = bson_append_oid(target, key, -1, &oid);
    break;
  }
  case ValueType::DOCUMENT: {
    bson_t child;
    ok = bson_append_document_begin(target, key, -1, &child);
    if (ok) {
      appendDocument(&child, value.asDocument());
      ok = bson_append_document_end(target, &child);
    }
    break;
  }
  case ValueType::ARRAY: {
    bson_t child;
    ok = bson_append_array_begin(target, key, -1, &child);
    if (ok) {
      const ValueArray &elements = value.asArray();
      for (size_t i = 0; i < elements.size(); ++i) {
        char indexBuf[16];
        const char *indexKey = nullptr;
        bson_uint32_to_string(static_cast<uint32_t>(i), &indexKey, indexBuf,
                              sizeof(indexBuf));
        appendValue(&child, indexKey, elements[i]);
      }
      ok = bson_append_array_end(target, &child);
    }
    break;
  }
  }
  if (!ok) {
    throw BsonConversionError(std::string("document too large to append "
                                          "field ") +
                              key);
  }
}

Value readValue(bson_iter_t *iter);

Document readDocument(bson_iter_t *iter) {
  Document document;
  while (bson_iter_next(iter)) {
    document.append(bson_iter_key(iter), readValue(iter));
  }
  return document;
}

Value unsupported(bson_iter_t *iter, const std::string &text) {
  Logger::warning(LogCategory::DATABASE, "BsonConverter::fromBson",
                  "Field '" + std::string(bson_iter_key(iter)) +
                      "' has a BSON type without a document counterpart; "
                      "read as string");
  return Value(text);
}

Value readValue(bson_iter_t *iter) {
  switch (bson_iter_type(iter)) {
  case BSON_TYPE_DOUBLE:
    return Value(bson_iter_double(iter));
  case BSON_TYPE_UTF8: {
    uint32_t length = 0;
    const char *text = bson_iter_utf8(iter, &length);
    return Value(std::string(text, length));
  }
  case BSON_TYPE_DOCUMENT: {
    bson_iter_t child;
    if (!bson_iter_recurse(iter, &child))
      throw BsonConversionError("corrupt embedded document");
    return Value(readDocument(&child));
  }
  case BSON_TYPE_ARRAY: {
    bson_iter_t child;
    if (!bson_iter_recurse(iter, &child))
      throw BsonConversionError("corrupt embedded array");
    ValueArray elements;
    while (bson_iter_next(&child)) {
      elements.push_back(readValue(&child));
    }
    return Value(std::move(elements));
  }
  case BSON_TYPE_BINARY: {
    bson_subtype_t subtype;
    uint32_t length = 0;
    const uint8_t *data = nullptr;
    bson_iter_binary(iter, &subtype, &length, &data);
    return Value(Binary{static_cast<uint8_t>(subtype),
                        std::vector<uint8_t>(data, data + length)});
  }
  case BSON_TYPE_OID: {
    ObjectId oid;
    std::memcpy(oid.bytes.data(), bson_iter_oid(iter)->bytes, 12);
    return Value(oid);
  }
  case BSON_TYPE_BOOL:
    return Value(bson_iter_bool(iter));
  case BSON_TYPE_DATE_TIME:
    return Value(DateTime{bson_iter_date_time(iter)});
  case BSON_TYPE_NULL:
    return Value();
  case BSON_TYPE_INT32:
    return Value(static_cast<int32_t>(bson_iter_int32(iter)));
  case BSON_TYPE_INT64:
    return Value(static_cast<int64_t>(bson_iter_int64(iter)));
  case BSON_TYPE_TIMESTAMP: {
    uint32_t seconds = 0;
    uint32_t increment = 0;
    bson_iter_timestamp(iter, &seconds, &increment);
    return Value(Timestamp{seconds, increment});
  }
  case BSON_TYPE_DECIMAL128: {
    bson_decimal128_t dec;
    bson_iter_decimal128(iter, &dec);
    char buf[BSON_DECIMAL128_STRING];
    bson_decimal128_to_string(&dec, buf);
    return Value(Decimal128{buf});
  }
  case BSON_TYPE_REGEX: {
    const char *options = nullptr;
    const char *pattern = bson_iter_regex(iter, &options);
    return unsupported(iter, "/" + std::string(pattern) + "/" +
                                 std::string(options ? options : ""));
  }
  case BSON_TYPE_CODE: {
    uint32_t length = 0;
    const char *code = bson_iter_code(iter, &length);
    return unsupported(iter, std::string(code, length));
  }
  case BSON_TYPE_SYMBOL: {
    uint32_t length = 0;
    const char *symbol = bson_iter_symbol(iter, &length);
    return unsupported(iter, std::string(symbol, length));
  }
  case BSON_TYPE_CODEWSCOPE: {
    uint32_t length = 0;
    uint32_t scopeLength = 0;
    const uint8_t *scope = nullptr;
    const char *code =
        bson_iter_codewscope(iter, &length, &scopeLength, &scope);
    return unsupported(iter, std::string(code, length));
  }
  case BSON_TYPE_MINKEY:
    return unsupported(iter, "MinKey");
  case BSON_TYPE_MAXKEY:
    return unsupported(iter, "MaxKey");
  case BSON_TYPE_UNDEFINED:
    return unsupported(iter, "undefined");
  case BSON_TYPE_DBPOINTER:
    return unsupported(iter, "DBPointer");
  default:
    break;
  }
  throw BsonConversionError("unknown BSON type in field " +
                            std::string(bson_iter_key(iter)));
}

} // namespace

BsonDocument BsonConverter::toBson(const Document &document) {
  BsonDocument bson;
  appendDocument(bson.get(), document);
  return bson;
}

Document BsonConverter::fromBson(const bson_t *bson) {
  bson_iter_t iter;
  if (!bson || !bson_iter_init(&iter, bson)) {
    throw BsonConversionError("invalid BSON document");
  }
  return readDocument(&iter);
}

BsonDocument BsonConverter::fromJson(const std::string &json) {
  if (json.empty())
    return BsonDocument();
  bson_error_t error;
  bson_t *bson = bson_new_from_json(
      reinterpret_cast<const uint8_t *>(json.data()),
      static_cast<ssize_t>(json.size()), &error);
  if (!bson) {
    throw BsonConversionError("invalid JSON '" + json +
                              "': " + std::string(error.message));
  }
  return BsonDocument(bson);
}
