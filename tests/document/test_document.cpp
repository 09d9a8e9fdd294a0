#include "document/document.h"
#include "document/document_key.h"
#include <cassert>
#include <iostream>

void testFieldOrderAndSet() {
  std::cout << "Testing Document - field order and set...\n";

  Document doc;
  doc.set("b", Value(1));
  doc.set("a", Value("x"));
  doc.set("c", Value(true));
  doc.set("a", Value("y"));

  assert(doc.size() == 3);
  assert(doc.fields()[0].name == "b");
  assert(doc.fields()[1].name == "a" && "set keeps the original position");
  assert(doc.get("a")->asString() == "y");
  assert(doc.fields()[2].name == "c");

  assert(doc.remove("b"));
  assert(!doc.remove("missing"));
  assert(!doc.contains("b"));
  assert(doc.fields()[0].name == "a");

  std::cout << "✓ Document field order test passed\n";
}

void testEqualityIsOrderSensitive() {
  std::cout << "Testing Document - equality...\n";

  Document first;
  first.set("a", Value(1));
  first.set("b", Value(2));
  Document second;
  second.set("b", Value(2));
  second.set("a", Value(1));
  Document third;
  third.set("a", Value(1));
  third.set("b", Value(2));

  assert(first != second);
  assert(first == third);
  assert(Value(1) != Value(static_cast<int64_t>(1)) &&
         "int32 and int64 are distinct types");

  std::cout << "✓ Document equality test passed\n";
}

void testValueTypes() {
  std::cout << "Testing Value - type tags...\n";

  assert(Value().type() == ValueType::NULL_VALUE);
  assert(Value(true).type() == ValueType::BOOLEAN);
  assert(Value(7).type() == ValueType::INT32);
  assert(Value(static_cast<int64_t>(7)).type() == ValueType::INT64);
  assert(Value(0.5).type() == ValueType::DOUBLE);
  assert(Value("s").type() == ValueType::STRING);
  assert(Value(Decimal128{"1.10"}).type() == ValueType::DECIMAL128);
  assert(Value(DateTime{0}).type() == ValueType::DATE_TIME);
  assert(Value(Document()).isDocument());
  assert(Value(ValueArray{Value(1)}).isArray());
  assert(valueTypeName(ValueType::OBJECT_ID) == "objectId");

  std::cout << "✓ Value type test passed\n";
}

void testObjectIdHex() {
  std::cout << "Testing ObjectId - hex conversion...\n";

  const std::string hex = "5f1b2c3d4e5f607182930a1b";
  auto oid = ObjectId::fromHex(hex);
  assert(oid.has_value());
  assert(oid->toHex() == hex);
  assert(ObjectId::fromHex("5F1B2C3D4E5F607182930A1B")->toHex() == hex);
  assert(!ObjectId::fromHex("5f1b2c3d4e5f607182930a1").has_value());
  assert(!ObjectId::fromHex("zz1b2c3d4e5f607182930a1b").has_value());

  std::cout << "✓ ObjectId hex test passed\n";
}

void testDocumentKey() {
  std::cout << "Testing DocumentKey...\n";

  Document withId;
  withId.set("_id", Value(42));
  withId.set("name", Value("a"));
  DocumentKey key = DocumentKey::fromDocument(withId, 9);
  assert(key.str() == "42");
  assert(!key.isPositional());

  Document stringId;
  stringId.set("_id", Value("42"));
  assert(DocumentKey::fromDocument(stringId, 0) != key &&
         "a string _id differs from a numeric one");

  Document withoutId;
  withoutId.set("name", Value("b"));
  DocumentKey positional = DocumentKey::fromDocument(withoutId, 9);
  assert(positional.str() == "index:9");
  assert(positional.isPositional());

  std::cout << "✓ DocumentKey test passed\n";
}

int main() {
  std::cout << "Running Document tests...\n\n";

  testFieldOrderAndSet();
  testEqualityIsOrderSensitive();
  testValueTypes();
  testObjectIdHex();
  testDocumentKey();

  std::cout << "\n✓ All Document tests passed!\n";
  return 0;
}
