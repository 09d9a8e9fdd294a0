#include "document/extended_json.h"
#include "flatten/column_discovery.h"
#include <cassert>
#include <iostream>

void testUnionInFirstSeenOrder() {
  std::cout << "Testing ColumnDiscovery - union of paths...\n";

  CsvFlattener flattener;
  ColumnDiscovery discovery(flattener);
  discovery.observe(ExtendedJson::parseDocument("{\"_id\":1,\"name\":\"a\"}"));
  discovery.observe(
      ExtendedJson::parseDocument("{\"_id\":2,\"tags\":[\"x\",\"y\"]}"));
  discovery.observe(ExtendedJson::parseDocument("{\"name\":\"c\",\"_id\":3}"));

  assert(discovery.observedCount() == 3);
  assert((discovery.schema().columns() ==
          std::vector<std::string>{"_id", "name", "tags[0]", "tags[1]"}));
  assert(discovery.lossyFields().empty());

  std::cout << "✓ Union of paths test passed\n";
}

void testLossyFields() {
  std::cout << "Testing ColumnDiscovery - lossy fields...\n";

  CsvFlattener flattener;
  ColumnDiscovery discovery(flattener);

  Document doc;
  doc.set("zip", Value("02134"));
  doc.set("price", Value(Decimal128{"9.99"}));
  doc.set("missing", Value());
  doc.set("count", Value(3));
  discovery.observe(doc);
  discovery.observe(doc);

  const auto &lossy = discovery.lossyFields();
  assert(lossy.size() == 3 && "each path is reported once");
  assert(lossy[0].path == "zip");
  assert(lossy[0].sourceType == ValueType::STRING);
  assert(lossy[0].importedAs == "int32");
  assert(lossy[1].path == "price" && lossy[1].importedAs == "double");
  assert(lossy[2].path == "missing" && lossy[2].importedAs == "absent");

  std::cout << "✓ Lossy fields test passed\n";
}

void testSentinelKeepsNulls() {
  std::cout << "Testing ColumnDiscovery - null sentinel...\n";

  FlattenOptions options;
  options.nullSentinel = "\\N";
  CsvFlattener flattener(options);
  ColumnDiscovery discovery(flattener);

  Document doc;
  doc.set("missing", Value());
  discovery.observe(doc);
  assert(discovery.lossyFields().empty());

  std::cout << "✓ Null sentinel test passed\n";
}

int main() {
  std::cout << "Running ColumnDiscovery tests...\n\n";

  testUnionInFirstSeenOrder();
  testLossyFields();
  testSentinelKeepsNulls();

  std::cout << "\n✓ All ColumnDiscovery tests passed!\n";
  return 0;
}
