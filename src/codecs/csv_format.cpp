#include "codecs/csv_format.h"
#include "transfer/transfer_errors.h"

CsvRecordReader::CsvRecordReader(TextInput &input, char delimiter)
    : input_(input), delimiter_(delimiter) {}

bool CsvRecordReader::readRecord(std::vector<std::string> &fields) {
  fields.clear();

  // Skip blank lines between records.
  while (true) {
    int c = input_.peek();
    if (c == -1)
      return false;
    if (c == '\n') {
      input_.get();
      continue;
    }
    if (c == '\r') {
      input_.get();
      if (input_.peek() == '\n')
        input_.get();
      continue;
    }
    break;
  }

  recordLine_ = input_.line();

  std::string field;
  if (first_) {
    first_ = false;
    // UTF-8 byte order mark written by spreadsheet tools.
    if (input_.peek() == 0xEF) {
      field.push_back(static_cast<char>(input_.get()));
      if (input_.peek() == 0xBB) {
        field.push_back(static_cast<char>(input_.get()));
        if (input_.peek() == 0xBF) {
          input_.get();
          field.clear();
        }
      }
    }
  }

  bool inQuotes = false;
  bool wasQuoted = false;

  while (true) {
    int c = input_.get();
    if (c == -1) {
      if (inQuotes) {
        throw TransferError(TransferErrorKind::MALFORMED_SOURCE,
                            "unterminated quoted field starting on line " +
                                std::to_string(recordLine_) + " of " +
                                input_.sourceName());
      }
      fields.push_back(std::move(field));
      return true;
    }

    char ch = static_cast<char>(c);
    if (inQuotes) {
      if (ch == '"') {
        if (input_.peek() == '"') {
          input_.get();
          field.push_back('"');
        } else {
          inQuotes = false;
        }
      } else {
        field.push_back(ch);
      }
      continue;
    }

    if (ch == '"' && !wasQuoted && field.empty()) {
      inQuotes = true;
      wasQuoted = true;
    } else if (ch == delimiter_) {
      fields.push_back(std::move(field));
      field.clear();
      wasQuoted = false;
    } else if (ch == '\n') {
      fields.push_back(std::move(field));
      return true;
    } else if (ch == '\r') {
      if (input_.peek() == '\n')
        input_.get();
      fields.push_back(std::move(field));
      return true;
    } else {
      field.push_back(ch);
    }
  }
}

namespace CsvFormat {

bool needsQuoting(const std::string &cell, char delimiter) {
  if (cell.empty())
    return false;
  if (cell.front() == ' ' || cell.back() == ' ' || cell.front() == '\t' ||
      cell.back() == '\t')
    return true;
  for (char c : cell) {
    if (c == delimiter || c == '"' || c == '\n' || c == '\r')
      return true;
  }
  return false;
}

std::string quote(const std::string &cell, char delimiter) {
  if (!needsQuoting(cell, delimiter))
    return cell;
  std::string out;
  out.reserve(cell.size() + 2);
  out.push_back('"');
  for (char c : cell) {
    if (c == '"')
      out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string formatRecord(const std::vector<std::string> &cells,
                         char delimiter) {
  std::string line;
  for (size_t i = 0; i < cells.size(); ++i) {
    if (i > 0)
      line.push_back(delimiter);
    line += quote(cells[i], delimiter);
  }
  line.push_back('\n');
  return line;
}

} // namespace CsvFormat
