#ifndef CSV_FLATTENER_H
#define CSV_FLATTENER_H

#include "document/document.h"
#include "flatten/column_schema.h"
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class EmptyCellPolicy { ABSENT, NULL_VALUE };

enum class CollisionPolicy { REJECT, SIDE_CHANNEL };

struct FlattenOptions {
  size_t maxDepth = 16;
  size_t maxArrayWidth = 64;
  // Cell text written for null values. When empty, null and absent fields
  // produce the same empty cell.
  std::string nullSentinel;
  EmptyCellPolicy emptyCell = EmptyCellPolicy::ABSENT;
  CollisionPolicy collision = CollisionPolicy::REJECT;

  // Defaults taken from TransferConfig and EngineConfig.
  static FlattenOptions fromConfig();
};

// Scalar stored next to nested fields under SIDE_CHANNEL.
inline constexpr const char *SIDE_CHANNEL_FIELD = "_value";

using FlattenedRow = std::vector<std::pair<std::string, std::string>>;

struct FlattenedCell {
  std::string path;
  std::string cell;
  ValueType sourceType;
};

enum class CsvFlattenErrorKind {
  TYPE_COLLISION,
  DUPLICATE_PATH,
  INDEX_LIMIT,
  CELL_COUNT
};

class CsvFlattenError : public std::runtime_error {
public:
  CsvFlattenError(CsvFlattenErrorKind kind, std::string path,
                  const std::string &message)
      : std::runtime_error(message), kind_(kind), path_(std::move(path)) {}

  CsvFlattenErrorKind kind() const { return kind_; }
  const std::string &path() const { return path_; }

private:
  CsvFlattenErrorKind kind_;
  std::string path_;
};

// Bridges nested documents and flat CSV rows.
//
// Paths use "." between document keys and "[i]" for array elements, e.g.
// "a.b[0].c". Containers nested deeper than maxDepth, arrays wider than
// maxArrayWidth, empty containers and documents whose keys contain path
// characters are written as a single cell of compact relaxed extended JSON,
// which unflatten parses back.
class CsvFlattener {
public:
  explicit CsvFlattener(FlattenOptions options = FlattenOptions());

  // The document's own paths in document order.
  FlattenedRow flatten(const Document &document) const;
  // One pair per schema column, in schema order. Absent paths yield an
  // empty cell; paths outside the schema are dropped.
  FlattenedRow flatten(const Document &document,
                       const ColumnSchema &schema) const;
  std::vector<std::string> flattenCells(const Document &document,
                                        const ColumnSchema &schema) const;
  std::vector<FlattenedCell> flattenTyped(const Document &document) const;

  Document unflatten(const FlattenedRow &row) const;
  Document unflatten(const std::vector<std::string> &cells,
                     const ColumnSchema &schema) const;

  ColumnSchema discoverColumns(const std::vector<Document> &documents) const;

  // Type inference for one cell; nullopt means the field is absent.
  std::optional<Value> inferCell(const std::string &cell) const;
  std::string encodeScalar(const Value &value) const;

  const FlattenOptions &options() const { return options_; }

private:
  void flattenValue(const std::string &path, const Value &value, size_t depth,
                    std::vector<FlattenedCell> &out) const;

  FlattenOptions options_;
};

#endif
