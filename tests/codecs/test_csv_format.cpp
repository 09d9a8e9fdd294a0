#include "codecs/csv_format.h"
#include "transfer/transfer_errors.h"
#include <cassert>
#include <iostream>

namespace {

std::vector<std::vector<std::string>> readAll(const std::string &text,
                                              char delimiter = ',') {
  StringByteReader reader(text);
  TextInput input(reader, 4);
  CsvRecordReader records(input, delimiter);
  std::vector<std::vector<std::string>> out;
  std::vector<std::string> fields;
  while (records.readRecord(fields)) {
    out.push_back(fields);
  }
  return out;
}

} // namespace

void testQuoting() {
  std::cout << "Testing CsvFormat - quoting...\n";

  assert(CsvFormat::quote("plain") == "plain");
  assert(CsvFormat::quote("a,b") == "\"a,b\"");
  assert(CsvFormat::quote("say \"hi\"") == "\"say \"\"hi\"\"\"");
  assert(CsvFormat::quote("two\nlines") == "\"two\nlines\"");
  assert(CsvFormat::quote(" padded") == "\" padded\"");
  assert(CsvFormat::quote("a;b", ';') == "\"a;b\"");
  assert(CsvFormat::quote("a,b", ';') == "a,b");
  assert(CsvFormat::formatRecord({"1", "", "x,y"}) == "1,,\"x,y\"\n");

  std::cout << "✓ Quoting test passed\n";
}

void testRecordReading() {
  std::cout << "Testing CsvRecordReader - records...\n";

  auto records =
      readAll("a,b,c\r\n1,\"x,y\",\"he said \"\"no\"\"\"\n\n"
              "2,\"multi\nline\",\n");
  assert(records.size() == 3);
  assert((records[0] == std::vector<std::string>{"a", "b", "c"}));
  assert((records[1] == std::vector<std::string>{"1", "x,y", "he said \"no\""}));
  assert((records[2] == std::vector<std::string>{"2", "multi\nline", ""}));

  auto noTrailingNewline = readAll("x,y\n1,2");
  assert(noTrailingNewline.size() == 2);
  assert(noTrailingNewline[1][1] == "2");

  auto semicolons = readAll("a;b\n1;2\n", ';');
  assert((semicolons[1] == std::vector<std::string>{"1", "2"}));

  std::cout << "✓ Record reading test passed\n";
}

void testRecordLines() {
  std::cout << "Testing CsvRecordReader - line numbers...\n";

  StringByteReader reader("h\n\"a\nb\"\nc\n");
  TextInput input(reader);
  CsvRecordReader records(input);
  std::vector<std::string> fields;

  assert(records.readRecord(fields) && records.recordLine() == 1);
  assert(records.readRecord(fields) && records.recordLine() == 2);
  assert(records.readRecord(fields) && records.recordLine() == 4);
  assert(fields[0] == "c");
  assert(!records.readRecord(fields));

  std::cout << "✓ Line number test passed\n";
}

void testByteOrderMark() {
  std::cout << "Testing CsvRecordReader - byte order mark...\n";

  auto records = readAll("\xEF\xBB\xBFname,age\nann,3\n");
  assert(records[0][0] == "name");

  std::cout << "✓ Byte order mark test passed\n";
}

void testUnterminatedQuote() {
  std::cout << "Testing CsvRecordReader - unterminated quote...\n";

  bool threw = false;
  try {
    readAll("a\n\"never closed\n");
  } catch (const TransferError &e) {
    threw = e.kind() == TransferErrorKind::MALFORMED_SOURCE;
  }
  assert(threw);

  std::cout << "✓ Unterminated quote test passed\n";
}

int main() {
  std::cout << "Running CSV format tests...\n\n";

  testQuoting();
  testRecordReading();
  testRecordLines();
  testByteOrderMark();
  testUnterminatedQuote();

  std::cout << "\n✓ All CSV format tests passed!\n";
  return 0;
}
