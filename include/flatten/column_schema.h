#ifndef COLUMN_SCHEMA_H
#define COLUMN_SCHEMA_H

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Ordered, de-duplicated list of column paths.
class ColumnSchema {
public:
  ColumnSchema() = default;
  // Throws std::invalid_argument when a column appears twice.
  explicit ColumnSchema(const std::vector<std::string> &columns);

  // Appends the column when unseen. Returns true if it was added.
  bool add(const std::string &column);

  size_t size() const { return columns_.size(); }
  bool empty() const { return columns_.empty(); }
  const std::vector<std::string> &columns() const { return columns_; }
  std::optional<size_t> indexOf(const std::string &column) const;
  bool contains(const std::string &column) const {
    return index_.count(column) > 0;
  }

  bool operator==(const ColumnSchema &o) const { return columns_ == o.columns_; }
  bool operator!=(const ColumnSchema &o) const { return !(*this == o); }

private:
  std::vector<std::string> columns_;
  std::unordered_map<std::string, size_t> index_;
};

#endif
