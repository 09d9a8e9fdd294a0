#include "document/document.h"
#include <cctype>

std::string valueTypeName(ValueType type) {
  switch (type) {
  case ValueType::NULL_VALUE:
    return "null";
  case ValueType::BOOLEAN:
    return "bool";
  case ValueType::INT32:
    return "int32";
  case ValueType::INT64:
    return "int64";
  case ValueType::DOUBLE:
    return "double";
  case ValueType::STRING:
    return "string";
  case ValueType::DECIMAL128:
    return "decimal128";
  case ValueType::BINARY:
    return "binary";
  case ValueType::DATE_TIME:
    return "date";
  case ValueType::TIMESTAMP:
    return "timestamp";
  case ValueType::OBJECT_ID:
    return "objectId";
  case ValueType::DOCUMENT:
    return "document";
  case ValueType::ARRAY:
    return "array";
  }
  return "unknown";
}

namespace {
int hexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}
} // namespace

bool ObjectId::isHex(std::string_view hex) {
  if (hex.size() != 24)
    return false;
  for (char c : hex) {
    if (hexDigit(c) < 0)
      return false;
  }
  return true;
}

std::optional<ObjectId> ObjectId::fromHex(std::string_view hex) {
  if (!isHex(hex))
    return std::nullopt;
  ObjectId oid;
  for (size_t i = 0; i < oid.bytes.size(); ++i) {
    oid.bytes[i] = static_cast<uint8_t>((hexDigit(hex[2 * i]) << 4) |
                                        hexDigit(hex[2 * i + 1]));
  }
  return oid;
}

std::string ObjectId::toHex() const {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(24);
  for (uint8_t b : bytes) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0f]);
  }
  return out;
}

size_t Document::size() const { return fields_.size(); }

bool Document::empty() const { return fields_.empty(); }

const Value *Document::get(std::string_view name) const {
  for (const auto &field : fields_) {
    if (field.name == name)
      return &field.value;
  }
  return nullptr;
}

Value *Document::get(std::string_view name) {
  for (auto &field : fields_) {
    if (field.name == name)
      return &field.value;
  }
  return nullptr;
}

bool Document::contains(std::string_view name) const {
  return get(name) != nullptr;
}

void Document::set(std::string name, Value value) {
  if (Value *existing = get(name)) {
    *existing = std::move(value);
    return;
  }
  fields_.push_back(DocumentField{std::move(name), std::move(value)});
}

void Document::append(std::string name, Value value) {
  fields_.push_back(DocumentField{std::move(name), std::move(value)});
}

bool Document::remove(std::string_view name) {
  for (auto it = fields_.begin(); it != fields_.end(); ++it) {
    if (it->name == name) {
      fields_.erase(it);
      return true;
    }
  }
  return false;
}

bool Document::operator==(const Document &o) const {
  return fields_ == o.fields_;
}
