#include "document/extended_json.h"
#include "utils/base64.h"
#include "utils/time_utils.h"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

using Json = ExtendedJson::Json;

namespace {

std::string subtypeHex(uint8_t subtype) {
  char buf[3];
  std::snprintf(buf, sizeof(buf), "%02x", static_cast<unsigned>(subtype));
  return buf;
}

bool parseInt64Text(const std::string &text, int64_t &out) {
  if (text.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  long long v = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end != text.c_str() + text.size())
    return false;
  out = static_cast<int64_t>(v);
  return true;
}

double parseDoubleText(const std::string &text) {
  if (text == "NaN")
    return std::numeric_limits<double>::quiet_NaN();
  if (text == "Infinity")
    return std::numeric_limits<double>::infinity();
  if (text == "-Infinity")
    return -std::numeric_limits<double>::infinity();
  errno = 0;
  char *end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size()) {
    throw ExtendedJsonError("invalid $numberDouble: " + text);
  }
  return v;
}

const std::string &requireString(const Json &json, const char *wrapper) {
  if (!json.is_string()) {
    throw ExtendedJsonError(std::string(wrapper) + " expects a string value");
  }
  return json.get_ref<const std::string &>();
}

uint32_t requireUInt32(const Json &json, const char *wrapper) {
  if (!json.is_number_integer() || json.get<int64_t>() < 0 ||
      json.get<int64_t>() > std::numeric_limits<uint32_t>::max()) {
    throw ExtendedJsonError(std::string(wrapper) +
                            " expects unsigned 32-bit integers");
  }
  return static_cast<uint32_t>(json.get<int64_t>());
}

Value parseDate(const Json &payload) {
  if (payload.is_string()) {
    auto millis = TimeUtils::parseIso8601(payload.get<std::string>());
    if (!millis) {
      throw ExtendedJsonError("invalid $date string: " +
                              payload.get<std::string>());
    }
    return DateTime{*millis};
  }
  if (payload.is_number_integer()) {
    return DateTime{payload.get<int64_t>()};
  }
  if (payload.is_object() && payload.size() == 1 &&
      payload.contains("$numberLong")) {
    int64_t millis = 0;
    if (!parseInt64Text(requireString(payload["$numberLong"], "$date"),
                        millis)) {
      throw ExtendedJsonError("invalid $date $numberLong");
    }
    return DateTime{millis};
  }
  throw ExtendedJsonError("invalid $date value");
}

Value parseBinary(const Json &object) {
  const Json &payload = object["$binary"];
  std::string base64;
  std::string subtype;
  if (payload.is_object()) {
    if (!payload.contains("base64") || !payload.contains("subType")) {
      throw ExtendedJsonError("$binary requires base64 and subType");
    }
    base64 = requireString(payload["base64"], "$binary.base64");
    subtype = requireString(payload["subType"], "$binary.subType");
  } else if (payload.is_string() && object.contains("$type")) {
    base64 = payload.get<std::string>();
    subtype = requireString(object["$type"], "$type");
  } else {
    throw ExtendedJsonError("invalid $binary value");
  }

  auto bytes = Base64::decode(base64);
  if (!bytes) {
    throw ExtendedJsonError("invalid base64 in $binary");
  }
  char *end = nullptr;
  unsigned long type = std::strtoul(subtype.c_str(), &end, 16);
  if (subtype.empty() || end != subtype.c_str() + subtype.size() ||
      type > 0xff) {
    throw ExtendedJsonError("invalid $binary subType: " + subtype);
  }
  return Binary{static_cast<uint8_t>(type), std::move(*bytes)};
}

// Returns true and fills out when the object is a recognized type wrapper.
bool parseWrapper(const Json &object, Value &out) {
  if (object.empty())
    return false;
  const std::string &key = object.begin().key();
  if (key.empty() || key[0] != '$')
    return false;

  if (object.size() == 2 && object.contains("$binary") &&
      object.contains("$type")) {
    out = parseBinary(object);
    return true;
  }
  if (object.size() != 1)
    return false;

  const Json &payload = object.begin().value();
  if (key == "$oid") {
    auto oid = ObjectId::fromHex(requireString(payload, "$oid"));
    if (!oid)
      throw ExtendedJsonError("invalid $oid");
    out = *oid;
  } else if (key == "$date") {
    out = parseDate(payload);
  } else if (key == "$numberInt") {
    int64_t v = 0;
    if (!parseInt64Text(requireString(payload, "$numberInt"), v) ||
        v < std::numeric_limits<int32_t>::min() ||
        v > std::numeric_limits<int32_t>::max()) {
      throw ExtendedJsonError("invalid $numberInt");
    }
    out = static_cast<int32_t>(v);
  } else if (key == "$numberLong") {
    int64_t v = 0;
    if (!parseInt64Text(requireString(payload, "$numberLong"), v))
      throw ExtendedJsonError("invalid $numberLong");
    out = v;
  } else if (key == "$numberDouble") {
    out = parseDoubleText(requireString(payload, "$numberDouble"));
  } else if (key == "$numberDecimal") {
    out = Decimal128{requireString(payload, "$numberDecimal")};
  } else if (key == "$binary") {
    out = parseBinary(object);
  } else if (key == "$timestamp") {
    if (!payload.is_object() || !payload.contains("t") ||
        !payload.contains("i")) {
      throw ExtendedJsonError("$timestamp requires t and i");
    }
    out = Timestamp{requireUInt32(payload["t"], "$timestamp"),
                    requireUInt32(payload["i"], "$timestamp")};
  } else {
    return false;
  }
  return true;
}

Json wrapNumber(const char *wrapper, const std::string &text) {
  Json j = Json::object();
  j[wrapper] = text;
  return j;
}

} // namespace

std::string ExtendedJson::formatDouble(double value) {
  if (std::isnan(value))
    return "NaN";
  if (std::isinf(value))
    return value > 0 ? "Infinity" : "-Infinity";

  char buf[32];
  for (int precision = 1; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
    if (std::strtod(buf, nullptr) == value)
      break;
  }
  std::string text(buf);
  if (text.find_first_of(".eE") == std::string::npos) {
    text += ".0";
  }
  return text;
}

Json ExtendedJson::toJson(const Value &value, ExtendedJsonMode mode) {
  const bool canonical = mode == ExtendedJsonMode::CANONICAL;

  switch (value.type()) {
  case ValueType::NULL_VALUE:
    return Json(nullptr);
  case ValueType::BOOLEAN:
    return Json(value.asBool());
  case ValueType::INT32:
    if (canonical)
      return wrapNumber("$numberInt", std::to_string(value.asInt32()));
    return Json(value.asInt32());
  case ValueType::INT64:
    if (canonical)
      return wrapNumber("$numberLong", std::to_string(value.asInt64()));
    return Json(value.asInt64());
  case ValueType::DOUBLE: {
    double d = value.asDouble();
    if (canonical || !std::isfinite(d))
      return wrapNumber("$numberDouble", formatDouble(d));
    return Json(d);
  }
  case ValueType::STRING:
    return Json(value.asString());
  case ValueType::DECIMAL128:
    return wrapNumber("$numberDecimal", value.asDecimal128().text);
  case ValueType::BINARY: {
    const Binary &bin = value.asBinary();
    Json payload = Json::object();
    payload["base64"] = Base64::encode(bin.data);
    payload["subType"] = subtypeHex(bin.subtype);
    Json j = Json::object();
    j["$binary"] = std::move(payload);
    return j;
  }
  case ValueType::DATE_TIME: {
    int64_t millis = value.asDateTime().millis;
    Json j = Json::object();
    if (!canonical && TimeUtils::isRelaxedDateRange(millis)) {
      j["$date"] = TimeUtils::formatIso8601(millis);
    } else {
      j["$date"] = wrapNumber("$numberLong", std::to_string(millis));
    }
    return j;
  }
  case ValueType::TIMESTAMP: {
    Json payload = Json::object();
    payload["t"] = value.asTimestamp().seconds;
    payload["i"] = value.asTimestamp().increment;
    Json j = Json::object();
    j["$timestamp"] = std::move(payload);
    return j;
  }
  case ValueType::OBJECT_ID: {
    Json j = Json::object();
    j["$oid"] = value.asObjectId().toHex();
    return j;
  }
  case ValueType::DOCUMENT:
    return toJson(value.asDocument(), mode);
  case ValueType::ARRAY: {
    Json arr = Json::array();
    for (const auto &element : value.asArray()) {
      arr.push_back(toJson(element, mode));
    }
    return arr;
  }
  }
  return Json(nullptr);
}

Json ExtendedJson::toJson(const Document &document, ExtendedJsonMode mode) {
  Json obj = Json::object();
  for (const auto &field : document.fields()) {
    obj[field.name] = toJson(field.value, mode);
  }
  return obj;
}

Value ExtendedJson::fromJson(const Json &json) {
  switch (json.type()) {
  case Json::value_t::null:
  case Json::value_t::discarded:
    return Value();
  case Json::value_t::boolean:
    return Value(json.get<bool>());
  case Json::value_t::number_integer: {
    int64_t v = json.get<int64_t>();
    if (v >= std::numeric_limits<int32_t>::min() &&
        v <= std::numeric_limits<int32_t>::max()) {
      return Value(static_cast<int32_t>(v));
    }
    return Value(v);
  }
  case Json::value_t::number_unsigned: {
    uint64_t v = json.get<uint64_t>();
    if (v <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max()))
      return Value(static_cast<int32_t>(v));
    if (v <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      return Value(static_cast<int64_t>(v));
    return Value(static_cast<double>(v));
  }
  case Json::value_t::number_float:
    return Value(json.get<double>());
  case Json::value_t::string:
    return Value(json.get<std::string>());
  case Json::value_t::array: {
    ValueArray arr;
    arr.reserve(json.size());
    for (const auto &element : json) {
      arr.push_back(fromJson(element));
    }
    return Value(std::move(arr));
  }
  case Json::value_t::object: {
    Value wrapped;
    if (parseWrapper(json, wrapped))
      return wrapped;
    return Value(documentFromJson(json));
  }
  case Json::value_t::binary:
    throw ExtendedJsonError("binary JSON values are not supported");
  }
  return Value();
}

Document ExtendedJson::documentFromJson(const Json &json) {
  if (!json.is_object()) {
    throw ExtendedJsonError("expected a JSON object, got " +
                            std::string(json.type_name()));
  }
  Document doc;
  for (auto it = json.begin(); it != json.end(); ++it) {
    doc.set(it.key(), fromJson(it.value()));
  }
  return doc;
}

std::string ExtendedJson::serialize(const Document &document,
                                    ExtendedJsonMode mode, int indent) {
  return toJson(document, mode)
      .dump(indent, ' ', false, Json::error_handler_t::replace);
}

std::string ExtendedJson::serializeValue(const Value &value,
                                         ExtendedJsonMode mode, int indent) {
  return toJson(value, mode)
      .dump(indent, ' ', false, Json::error_handler_t::replace);
}

Document ExtendedJson::parseDocument(std::string_view text) {
  Json json;
  try {
    json = Json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error &e) {
    throw ExtendedJsonError(e.what());
  }
  return documentFromJson(json);
}

Value ExtendedJson::parseValue(std::string_view text) {
  Json json;
  try {
    json = Json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error &e) {
    throw ExtendedJsonError(e.what());
  }
  return fromJson(json);
}
