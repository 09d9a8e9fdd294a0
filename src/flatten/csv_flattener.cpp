#include "flatten/csv_flattener.h"
#include "core/engine_config.h"
#include "core/transfer_config.h"
#include "document/extended_json.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <memory>

FlattenOptions FlattenOptions::fromConfig() {
  FlattenOptions options;
  options.maxDepth = TransferConfig::getFlattenMaxDepth();
  options.maxArrayWidth = TransferConfig::getFlattenMaxArrayWidth();
  options.nullSentinel = EngineConfig::getNullSentinel();
  return options;
}

namespace {

struct PathSegment {
  bool isIndex = false;
  std::string key;
  size_t index = 0;
};

bool isPathChar(char c) { return c == '.' || c == '[' || c == ']'; }

bool hasPathCharKeys(const Document &document) {
  for (const auto &field : document.fields()) {
    if (field.name.empty())
      return true;
    for (char c : field.name) {
      if (isPathChar(c))
        return true;
    }
  }
  return false;
}

// Splits "a.b[0][1].c" into key/index segments. A path that does not follow
// the grammar is returned as one key segment holding the whole text.
std::vector<PathSegment> tokenizePath(const std::string &path) {
  std::vector<PathSegment> segments;
  size_t pos = 0;
  bool expectKey = true;

  auto verbatim = [&path]() {
    PathSegment whole;
    whole.key = path;
    return std::vector<PathSegment>{whole};
  };

  while (pos < path.size()) {
    if (expectKey) {
      size_t end = pos;
      while (end < path.size() && !isPathChar(path[end]))
        ++end;
      if (end == pos)
        return verbatim();
      PathSegment seg;
      seg.key = path.substr(pos, end - pos);
      segments.push_back(std::move(seg));
      pos = end;
      expectKey = false;
      continue;
    }

    if (path[pos] == '.') {
      ++pos;
      expectKey = true;
      if (pos == path.size())
        return verbatim();
    } else if (path[pos] == '[') {
      size_t close = path.find(']', pos);
      if (close == std::string::npos || close == pos + 1)
        return verbatim();
      size_t index = 0;
      for (size_t i = pos + 1; i < close; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(path[i])))
          return verbatim();
        if (index > std::numeric_limits<size_t>::max() / 10)
          return verbatim();
        index = index * 10 + static_cast<size_t>(path[i] - '0');
      }
      PathSegment seg;
      seg.isIndex = true;
      seg.index = index;
      segments.push_back(std::move(seg));
      pos = close + 1;
    } else {
      return verbatim();
    }
  }

  if (segments.empty())
    return verbatim();
  return segments;
}

// Intermediate tree used while rebuilding a document from a row. Children
// keep creation order, which is column order.
struct Node {
  enum class Kind { EMPTY, SCALAR, OBJECT, ARRAY };

  Kind kind = Kind::EMPTY;
  Value scalar;
  bool hasScalar = false;
  std::vector<std::pair<std::string, std::unique_ptr<Node>>> children;
  std::vector<std::unique_ptr<Node>> elements;

  Node *child(const std::string &key) {
    for (auto &entry : children) {
      if (entry.first == key)
        return entry.second.get();
    }
    children.emplace_back(key, std::make_unique<Node>());
    return children.back().second.get();
  }

  Node *element(size_t index) {
    if (elements.size() <= index)
      elements.resize(index + 1);
    if (!elements[index])
      elements[index] = std::make_unique<Node>();
    return elements[index].get();
  }

  Value toValue() const {
    switch (kind) {
    case Kind::SCALAR:
      return scalar;
    case Kind::OBJECT: {
      Document doc;
      if (hasScalar)
        doc.append(SIDE_CHANNEL_FIELD, scalar);
      for (const auto &entry : children)
        doc.append(entry.first, entry.second->toValue());
      return Value(std::move(doc));
    }
    case Kind::ARRAY: {
      ValueArray arr;
      arr.reserve(elements.size());
      for (const auto &element : elements)
        arr.push_back(element ? element->toValue() : Value());
      return Value(std::move(arr));
    }
    case Kind::EMPTY:
      break;
    }
    return Value();
  }
};

class RowBuilder {
public:
  explicit RowBuilder(const FlattenOptions &options) : options_(options) {
    root_.kind = Node::Kind::OBJECT;
  }

  void insert(const std::string &path, Value value) {
    std::vector<PathSegment> segments = tokenizePath(path);
    Node *node = &root_;

    for (size_t i = 0; i < segments.size(); ++i) {
      const PathSegment &seg = segments[i];
      prepareContainer(*node, seg, path);

      Node *next = nullptr;
      if (seg.isIndex) {
        if (seg.index >= options_.maxArrayWidth) {
          throw CsvFlattenError(CsvFlattenErrorKind::INDEX_LIMIT, path,
                                "array index in '" + path +
                                    "' exceeds the configured array width");
        }
        next = node->element(seg.index);
      } else {
        if (node->hasScalar && seg.key == SIDE_CHANNEL_FIELD) {
          throw collision(path);
        }
        next = node->child(seg.key);
      }

      if (i + 1 == segments.size()) {
        placeScalar(*next, std::move(value), path);
        return;
      }
      node = next;
    }
  }

  Document build() const { return root_.toValue().asDocument(); }

private:
  CsvFlattenError collision(const std::string &path) const {
    return CsvFlattenError(CsvFlattenErrorKind::TYPE_COLLISION, path,
                           "column '" + path +
                               "' is both a value and a nested container");
  }

  void prepareContainer(Node &node, const PathSegment &seg,
                        const std::string &path) const {
    Node::Kind wanted = seg.isIndex ? Node::Kind::ARRAY : Node::Kind::OBJECT;
    if (node.kind == Node::Kind::EMPTY) {
      node.kind = wanted;
      return;
    }
    if (node.kind == wanted)
      return;
    if (node.kind == Node::Kind::SCALAR && !seg.isIndex &&
        options_.collision == CollisionPolicy::SIDE_CHANNEL) {
      node.kind = Node::Kind::OBJECT;
      node.hasScalar = true;
      if (seg.key == SIDE_CHANNEL_FIELD)
        throw collision(path);
      return;
    }
    throw collision(path);
  }

  void placeScalar(Node &node, Value value, const std::string &path) const {
    switch (node.kind) {
    case Node::Kind::EMPTY:
      node.kind = Node::Kind::SCALAR;
      node.scalar = std::move(value);
      return;
    case Node::Kind::SCALAR:
      throw CsvFlattenError(CsvFlattenErrorKind::DUPLICATE_PATH, path,
                            "column '" + path + "' appears more than once");
    case Node::Kind::OBJECT:
      if (options_.collision == CollisionPolicy::SIDE_CHANNEL &&
          !node.hasScalar) {
        for (const auto &entry : node.children) {
          if (entry.first == SIDE_CHANNEL_FIELD)
            throw collision(path);
        }
        node.hasScalar = true;
        node.scalar = std::move(value);
        return;
      }
      throw collision(path);
    case Node::Kind::ARRAY:
      throw collision(path);
    }
  }

  const FlattenOptions &options_;
  Node root_;
};

bool isStrictInteger(const std::string &text) {
  size_t start = (!text.empty() && text[0] == '-') ? 1 : 0;
  if (start == text.size())
    return false;
  for (size_t i = start; i < text.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i])))
      return false;
  }
  return true;
}

// -?digits[.digits][(e|E)[+-]digits] with a fraction or an exponent.
bool isStrictFloat(const std::string &text) {
  size_t pos = (!text.empty() && text[0] == '-') ? 1 : 0;
  size_t digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    ++pos;
    ++digits;
  }
  if (digits == 0)
    return false;

  bool marker = false;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    size_t fraction = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      ++pos;
      ++fraction;
    }
    if (fraction == 0)
      return false;
    marker = true;
  }
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
      ++pos;
    size_t exponent = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      ++pos;
      ++exponent;
    }
    if (exponent == 0)
      return false;
    marker = true;
  }
  return marker && pos == text.size();
}

// Exactly the shape formatIso8601 writes: 2024-01-02T03:04:05.006Z.
bool isCanonicalDate(const std::string &text) {
  if (text.size() != 24 || text[4] != '-' || text[7] != '-' ||
      text[10] != 'T' || text[13] != ':' || text[16] != ':' ||
      text[19] != '.' || text[23] != 'Z') {
    return false;
  }
  return true;
}

} // namespace

CsvFlattener::CsvFlattener(FlattenOptions options)
    : options_(std::move(options)) {
  if (options_.maxDepth == 0)
    options_.maxDepth = 1;
}

std::string CsvFlattener::encodeScalar(const Value &value) const {
  switch (value.type()) {
  case ValueType::NULL_VALUE:
    return options_.nullSentinel;
  case ValueType::BOOLEAN:
    return value.asBool() ? "true" : "false";
  case ValueType::INT32:
    return std::to_string(value.asInt32());
  case ValueType::INT64:
    return std::to_string(value.asInt64());
  case ValueType::DOUBLE:
    return ExtendedJson::formatDouble(value.asDouble());
  case ValueType::STRING:
    return value.asString();
  case ValueType::DECIMAL128:
    return value.asDecimal128().text;
  case ValueType::DATE_TIME:
    return TimeUtils::formatIso8601(value.asDateTime().millis);
  case ValueType::OBJECT_ID:
    return value.asObjectId().toHex();
  case ValueType::BINARY:
  case ValueType::TIMESTAMP:
  case ValueType::DOCUMENT:
  case ValueType::ARRAY:
    return ExtendedJson::serializeValue(value, ExtendedJsonMode::RELAXED);
  }
  return std::string();
}

void CsvFlattener::flattenValue(const std::string &path, const Value &value,
                                size_t depth,
                                std::vector<FlattenedCell> &out) const {
  switch (value.type()) {
  case ValueType::DOCUMENT: {
    const Document &doc = value.asDocument();
    if (doc.empty() || depth >= options_.maxDepth || hasPathCharKeys(doc)) {
      out.push_back({path, encodeScalar(value), ValueType::DOCUMENT});
      return;
    }
    for (const auto &field : doc.fields()) {
      flattenValue(path + "." + field.name, field.value, depth + 1, out);
    }
    return;
  }
  case ValueType::ARRAY: {
    const ValueArray &arr = value.asArray();
    if (arr.empty() || depth >= options_.maxDepth ||
        arr.size() > options_.maxArrayWidth) {
      out.push_back({path, encodeScalar(value), ValueType::ARRAY});
      return;
    }
    for (size_t i = 0; i < arr.size(); ++i) {
      flattenValue(path + "[" + std::to_string(i) + "]", arr[i], depth + 1,
                   out);
    }
    return;
  }
  default:
    out.push_back({path, encodeScalar(value), value.type()});
    return;
  }
}

std::vector<FlattenedCell>
CsvFlattener::flattenTyped(const Document &document) const {
  std::vector<FlattenedCell> cells;
  for (const auto &field : document.fields()) {
    flattenValue(field.name, field.value, 1, cells);
  }
  return cells;
}

FlattenedRow CsvFlattener::flatten(const Document &document) const {
  FlattenedRow row;
  for (auto &cell : flattenTyped(document)) {
    row.emplace_back(std::move(cell.path), std::move(cell.cell));
  }
  return row;
}

std::vector<std::string>
CsvFlattener::flattenCells(const Document &document,
                           const ColumnSchema &schema) const {
  std::vector<std::string> cells(schema.size());
  for (auto &cell : flattenTyped(document)) {
    if (auto index = schema.indexOf(cell.path)) {
      cells[*index] = std::move(cell.cell);
    }
  }
  return cells;
}

FlattenedRow CsvFlattener::flatten(const Document &document,
                                   const ColumnSchema &schema) const {
  std::vector<std::string> cells = flattenCells(document, schema);
  FlattenedRow row;
  row.reserve(schema.size());
  for (size_t i = 0; i < schema.size(); ++i) {
    row.emplace_back(schema.columns()[i], std::move(cells[i]));
  }
  return row;
}

std::optional<Value> CsvFlattener::inferCell(const std::string &cell) const {
  if (!options_.nullSentinel.empty() && cell == options_.nullSentinel)
    return Value();
  // Blank cells, whitespace included, follow the empty-cell policy.
  std::string trimmed = StringUtils::trim(cell);
  if (trimmed.empty()) {
    if (options_.emptyCell == EmptyCellPolicy::NULL_VALUE)
      return Value();
    return std::nullopt;
  }

  if (isStrictInteger(trimmed)) {
    errno = 0;
    long long v = std::strtoll(trimmed.c_str(), nullptr, 10);
    if (errno != ERANGE) {
      if (v >= std::numeric_limits<int32_t>::min() &&
          v <= std::numeric_limits<int32_t>::max()) {
        return Value(static_cast<int32_t>(v));
      }
      return Value(static_cast<int64_t>(v));
    }
  }

  if (isStrictFloat(trimmed)) {
    double d = std::strtod(trimmed.c_str(), nullptr);
    if (std::isfinite(d))
      return Value(d);
  }
  if (trimmed == "NaN")
    return Value(std::numeric_limits<double>::quiet_NaN());
  if (trimmed == "Infinity")
    return Value(std::numeric_limits<double>::infinity());
  if (trimmed == "-Infinity")
    return Value(-std::numeric_limits<double>::infinity());

  if (StringUtils::equalsIgnoreCase(trimmed, "true"))
    return Value(true);
  if (StringUtils::equalsIgnoreCase(trimmed, "false"))
    return Value(false);

  if (auto oid = ObjectId::fromHex(trimmed))
    return Value(*oid);

  if (isCanonicalDate(trimmed)) {
    if (auto millis = TimeUtils::parseIso8601(trimmed))
      return Value(DateTime{*millis});
  }

  if (trimmed.front() == '{' || trimmed.front() == '[') {
    try {
      return ExtendedJson::parseValue(trimmed);
    } catch (const ExtendedJsonError &) {
      // Not JSON after all; keep the text.
    }
  }

  return Value(cell);
}

Document CsvFlattener::unflatten(const FlattenedRow &row) const {
  RowBuilder builder(options_);
  for (const auto &entry : row) {
    std::optional<Value> value = inferCell(entry.second);
    if (value) {
      builder.insert(entry.first, std::move(*value));
    }
  }
  return builder.build();
}

Document CsvFlattener::unflatten(const std::vector<std::string> &cells,
                                 const ColumnSchema &schema) const {
  if (cells.size() != schema.size()) {
    throw CsvFlattenError(CsvFlattenErrorKind::CELL_COUNT, "",
                          "row has " + std::to_string(cells.size()) +
                              " cells, header has " +
                              std::to_string(schema.size()));
  }
  RowBuilder builder(options_);
  for (size_t i = 0; i < cells.size(); ++i) {
    std::optional<Value> value = inferCell(cells[i]);
    if (value) {
      builder.insert(schema.columns()[i], std::move(*value));
    }
  }
  return builder.build();
}

ColumnSchema
CsvFlattener::discoverColumns(const std::vector<Document> &documents) const {
  ColumnSchema schema;
  for (const auto &document : documents) {
    for (const auto &cell : flattenTyped(document)) {
      schema.add(cell.path);
    }
  }
  return schema;
}
