#ifndef EXTENDED_JSON_H
#define EXTENDED_JSON_H

#include "document/document.h"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

enum class ExtendedJsonMode { RELAXED, CANONICAL };

class ExtendedJsonError : public std::runtime_error {
public:
  explicit ExtendedJsonError(const std::string &message)
      : std::runtime_error(message) {}
};

// Conversion between Document/Value and MongoDB extended JSON. Field order
// is kept by using nlohmann::ordered_json throughout.
//
// Writing: RELAXED renders int32, int64 and finite doubles as plain JSON
// numbers and dates between 1970 and 9999 as ISO strings. CANONICAL wraps
// every numeric type ($numberInt, $numberLong, $numberDouble) and writes
// dates as {"$numberLong": "<millis>"}. Both modes share $oid,
// $numberDecimal, $binary and $timestamp.
//
// Reading accepts both modes, the legacy {"$binary": "...", "$type": "..."}
// form and numeric $date values. Malformed type wrappers raise
// ExtendedJsonError, as does any text that is not valid JSON.
class ExtendedJson {
public:
  using Json = nlohmann::ordered_json;

  static Json toJson(const Value &value, ExtendedJsonMode mode);
  static Json toJson(const Document &document, ExtendedJsonMode mode);

  static Value fromJson(const Json &json);
  static Document documentFromJson(const Json &json);

  // indent < 0 produces compact output.
  static std::string serialize(const Document &document, ExtendedJsonMode mode,
                               int indent = -1);
  static std::string serializeValue(const Value &value, ExtendedJsonMode mode,
                                    int indent = -1);

  static Document parseDocument(std::string_view text);
  static Value parseValue(std::string_view text);

  // Shortest decimal text that reads back to the same double. Integral
  // values keep a trailing ".0" so they are not mistaken for integers.
  static std::string formatDouble(double value);
};

#endif
