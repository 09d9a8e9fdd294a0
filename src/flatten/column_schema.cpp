#include "flatten/column_schema.h"
#include <stdexcept>

ColumnSchema::ColumnSchema(const std::vector<std::string> &columns) {
  for (const auto &column : columns) {
    if (!add(column)) {
      throw std::invalid_argument("duplicate column: " + column);
    }
  }
}

bool ColumnSchema::add(const std::string &column) {
  if (index_.count(column))
    return false;
  index_.emplace(column, columns_.size());
  columns_.push_back(column);
  return true;
}

std::optional<size_t> ColumnSchema::indexOf(const std::string &column) const {
  auto it = index_.find(column);
  if (it == index_.end())
    return std::nullopt;
  return it->second;
}
