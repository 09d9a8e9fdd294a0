#ifndef CSV_FORMAT_H
#define CSV_FORMAT_H

#include "io/byte_stream.h"
#include <cstdint>
#include <string>
#include <vector>

// RFC 4180 record splitting and quoting.
class CsvRecordReader {
public:
  explicit CsvRecordReader(TextInput &input, char delimiter = ',');

  // Reads the next record. Quoted fields may contain delimiters, doubled
  // quotes and line breaks. Blank lines are skipped. Returns false at end of
  // input. An unterminated quoted field raises TransferError.
  bool readRecord(std::vector<std::string> &fields);

  // Line on which the last returned record started.
  uint64_t recordLine() const { return recordLine_; }

private:
  TextInput &input_;
  char delimiter_;
  uint64_t recordLine_ = 0;
  bool first_ = true;
};

namespace CsvFormat {

bool needsQuoting(const std::string &cell, char delimiter = ',');
std::string quote(const std::string &cell, char delimiter = ',');
// One record including its "\n" terminator.
std::string formatRecord(const std::vector<std::string> &cells,
                         char delimiter = ',');

} // namespace CsvFormat

#endif
