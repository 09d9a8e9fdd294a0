#ifndef COLUMN_DISCOVERY_H
#define COLUMN_DISCOVERY_H

#include "flatten/column_schema.h"
#include "flatten/csv_flattener.h"
#include <string>
#include <unordered_set>
#include <vector>

enum class ColumnDiscoveryMode { FULL_SCAN, SAMPLE };

enum class UnseenColumnPolicy { DROP, APPEND };

// A path whose cells will not read back as the type they were written from.
struct LossyField {
  std::string path;
  ValueType sourceType;
  std::string importedAs;
};

// Accumulates the union of column paths over a stream of documents, in
// first-seen order, and notes paths that do not survive a CSV round trip.
class ColumnDiscovery {
public:
  explicit ColumnDiscovery(const CsvFlattener &flattener);

  void observe(const Document &document);

  const ColumnSchema &schema() const { return schema_; }
  size_t observedCount() const { return observed_; }
  const std::vector<LossyField> &lossyFields() const { return lossy_; }

private:
  const CsvFlattener &flattener_;
  ColumnSchema schema_;
  size_t observed_ = 0;
  std::vector<LossyField> lossy_;
  std::unordered_set<std::string> lossyPaths_;
};

#endif
