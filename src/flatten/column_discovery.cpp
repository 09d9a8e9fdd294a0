#include "flatten/column_discovery.h"

ColumnDiscovery::ColumnDiscovery(const CsvFlattener &flattener)
    : flattener_(flattener) {}

void ColumnDiscovery::observe(const Document &document) {
  ++observed_;
  for (const auto &cell : flattener_.flattenTyped(document)) {
    schema_.add(cell.path);

    if (lossyPaths_.count(cell.path))
      continue;

    std::optional<Value> readBack = flattener_.inferCell(cell.cell);
    std::string importedAs =
        readBack ? valueTypeName(readBack->type()) : std::string("absent");
    if (!readBack || readBack->type() != cell.sourceType) {
      lossyPaths_.insert(cell.path);
      lossy_.push_back({cell.path, cell.sourceType, importedAs});
    }
  }
}
