#ifndef DOCUMENT_H
#define DOCUMENT_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Alternatives of Value, in variant index order.
enum class ValueType {
  NULL_VALUE = 0,
  BOOLEAN,
  INT32,
  INT64,
  DOUBLE,
  STRING,
  DECIMAL128,
  BINARY,
  DATE_TIME,
  TIMESTAMP,
  OBJECT_ID,
  DOCUMENT,
  ARRAY
};

std::string valueTypeName(ValueType type);

struct NullValue {
  bool operator==(const NullValue &) const { return true; }
  bool operator!=(const NullValue &) const { return false; }
};

struct Decimal128 {
  std::string text;

  bool operator==(const Decimal128 &o) const { return text == o.text; }
  bool operator!=(const Decimal128 &o) const { return !(*this == o); }
};

struct Binary {
  uint8_t subtype = 0;
  std::vector<uint8_t> data;

  bool operator==(const Binary &o) const {
    return subtype == o.subtype && data == o.data;
  }
  bool operator!=(const Binary &o) const { return !(*this == o); }
};

// Milliseconds since the Unix epoch, UTC.
struct DateTime {
  int64_t millis = 0;

  bool operator==(const DateTime &o) const { return millis == o.millis; }
  bool operator!=(const DateTime &o) const { return !(*this == o); }
};

struct Timestamp {
  uint32_t seconds = 0;
  uint32_t increment = 0;

  bool operator==(const Timestamp &o) const {
    return seconds == o.seconds && increment == o.increment;
  }
  bool operator!=(const Timestamp &o) const { return !(*this == o); }
};

struct ObjectId {
  std::array<uint8_t, 12> bytes{};

  static std::optional<ObjectId> fromHex(std::string_view hex);
  static bool isHex(std::string_view hex);
  std::string toHex() const;

  bool operator==(const ObjectId &o) const { return bytes == o.bytes; }
  bool operator!=(const ObjectId &o) const { return !(*this == o); }
};

class Value;
struct DocumentField;

// Ordered field list. Field order is significant and preserved through
// every codec.
class Document {
public:
  Document() = default;

  size_t size() const;
  bool empty() const;

  const Value *get(std::string_view name) const;
  Value *get(std::string_view name);
  bool contains(std::string_view name) const;

  // Replaces an existing field in place, or appends a new one.
  void set(std::string name, Value value);
  // Appends without checking for an existing field of the same name.
  void append(std::string name, Value value);
  bool remove(std::string_view name);

  const std::vector<DocumentField> &fields() const { return fields_; }
  std::vector<DocumentField> &fields() { return fields_; }

  bool operator==(const Document &o) const;
  bool operator!=(const Document &o) const { return !(*this == o); }

private:
  std::vector<DocumentField> fields_;
};

using ValueArray = std::vector<Value>;

class Value {
public:
  using Storage =
      std::variant<NullValue, bool, int32_t, int64_t, double, std::string,
                   Decimal128, Binary, DateTime, Timestamp, ObjectId, Document,
                   ValueArray>;

  Value() = default;
  Value(NullValue v) : storage_(v) {}
  Value(bool v) : storage_(v) {}
  Value(int32_t v) : storage_(v) {}
  Value(int64_t v) : storage_(v) {}
  Value(double v) : storage_(v) {}
  Value(const char *v) : storage_(std::string(v)) {}
  Value(std::string v) : storage_(std::move(v)) {}
  Value(Decimal128 v) : storage_(std::move(v)) {}
  Value(Binary v) : storage_(std::move(v)) {}
  Value(DateTime v) : storage_(v) {}
  Value(Timestamp v) : storage_(v) {}
  Value(ObjectId v) : storage_(v) {}
  Value(Document v) : storage_(std::move(v)) {}
  Value(ValueArray v) : storage_(std::move(v)) {}

  ValueType type() const { return static_cast<ValueType>(storage_.index()); }

  bool isNull() const { return type() == ValueType::NULL_VALUE; }
  bool isDocument() const { return type() == ValueType::DOCUMENT; }
  bool isArray() const { return type() == ValueType::ARRAY; }
  bool isContainer() const { return isDocument() || isArray(); }

  bool asBool() const { return std::get<bool>(storage_); }
  int32_t asInt32() const { return std::get<int32_t>(storage_); }
  int64_t asInt64() const { return std::get<int64_t>(storage_); }
  double asDouble() const { return std::get<double>(storage_); }
  const std::string &asString() const { return std::get<std::string>(storage_); }
  const Decimal128 &asDecimal128() const {
    return std::get<Decimal128>(storage_);
  }
  const Binary &asBinary() const { return std::get<Binary>(storage_); }
  DateTime asDateTime() const { return std::get<DateTime>(storage_); }
  Timestamp asTimestamp() const { return std::get<Timestamp>(storage_); }
  const ObjectId &asObjectId() const { return std::get<ObjectId>(storage_); }
  const Document &asDocument() const { return std::get<Document>(storage_); }
  Document &asDocument() { return std::get<Document>(storage_); }
  const ValueArray &asArray() const { return std::get<ValueArray>(storage_); }
  ValueArray &asArray() { return std::get<ValueArray>(storage_); }

  const Storage &storage() const { return storage_; }

  bool operator==(const Value &o) const { return storage_ == o.storage_; }
  bool operator!=(const Value &o) const { return !(*this == o); }

private:
  Storage storage_;
};

struct DocumentField {
  std::string name;
  Value value;

  bool operator==(const DocumentField &o) const {
    return name == o.name && value == o.value;
  }
  bool operator!=(const DocumentField &o) const { return !(*this == o); }
};

#endif
