#include "transfer/memory_endpoints.h"
#include "transfer/stream_endpoints.h"
#include "transfer/transfer_pipeline.h"
#include <cassert>
#include <iostream>

namespace {

TransferJob memoryJob(TransferFormat format = TransferFormat::JSON_LINES) {
  TransferJob job;
  job.id = "test-job";
  job.source = EndpointDescriptor::memory("source");
  job.destination = EndpointDescriptor::memory("destination");
  job.format = format;
  return job;
}

TransferUnit unit(std::unique_ptr<IDocumentSource> source,
                  std::unique_ptr<IDocumentSink> sink,
                  const std::string &label = "unit") {
  TransferUnit u;
  u.label = label;
  u.source = std::move(source);
  u.sink = std::move(sink);
  return u;
}

TransferOutcome runUnits(const TransferJob &job,
                         std::vector<TransferUnit> units,
                         ProgressChannel *progress = nullptr,
                         const CancellationToken &cancel = CancellationToken()) {
  ProgressChannel local(1024);
  TransferPipeline pipeline(std::move(units));
  return pipeline.run(job, progress ? *progress : local, cancel);
}

std::vector<Document> sampleDocuments(size_t count) {
  std::vector<Document> docs;
  for (size_t i = 0; i < count; ++i) {
    Document doc;
    doc.set("_id", Value(static_cast<int32_t>(i)));
    doc.set("name", Value("n" + std::to_string(i)));
    Document nested;
    nested.set("v", Value(static_cast<int32_t>(i * 2)));
    doc.set("nested", Value(std::move(nested)));
    if (i % 7 == 0)
      doc.set("rare", Value(true));
    docs.push_back(std::move(doc));
  }
  return docs;
}

std::string exportToString(const std::vector<Document> &docs,
                           TransferFormat format, size_t batchSize) {
  TransferJob job = memoryJob(format);
  job.options.batchSize = batchSize;
  auto output = std::make_shared<std::string>();
  std::vector<TransferUnit> units;
  units.push_back(unit(std::make_unique<MemoryDocumentSource>(docs),
                       StreamDocumentSink::toString(
                           output, format, job.options.codecOptions())));
  TransferOutcome outcome = runUnits(job, std::move(units));
  assert(outcome.state == TransferState::COMPLETED);
  assert(outcome.committed == docs.size());
  return *output;
}

// Forwards to another sink and cancels the token after a number of batches.
class CancellingSink : public IDocumentSink {
public:
  CancellingSink(std::unique_ptr<IDocumentSink> inner, CancellationToken token,
                 size_t cancelAfter)
      : inner_(std::move(inner)), token_(token), cancelAfter_(cancelAfter) {}

  bool requiresColumnSchema() const override {
    return inner_->requiresColumnSchema();
  }
  void open(const ColumnSchema *schema) override { inner_->open(schema); }
  BatchWriteResult writeBatch(const std::vector<Document> &documents) override {
    BatchWriteResult result = inner_->writeBatch(documents);
    if (++batches_ == cancelAfter_)
      token_.cancel();
    return result;
  }
  void close() override { inner_->close(); }
  std::string describe() const override { return inner_->describe(); }

private:
  std::unique_ptr<IDocumentSink> inner_;
  CancellationToken token_;
  size_t cancelAfter_;
  size_t batches_ = 0;
};

// Accepts one batch, then reports the destination as gone.
class FailingSink : public IDocumentSink {
public:
  explicit FailingSink(bool &closed) : closed_(closed) {}

  void open(const ColumnSchema *) override {}
  BatchWriteResult writeBatch(const std::vector<Document> &documents) override {
    if (++batches_ > 1) {
      throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                          "connection reset");
    }
    BatchWriteResult result;
    result.written = documents.size();
    return result;
  }
  void close() override { closed_ = true; }
  std::string describe() const override { return "failing"; }

private:
  bool &closed_;
  size_t batches_ = 0;
};

class FakeArchiveTool : public IArchiveTool {
public:
  FakeArchiveTool(std::vector<std::string> lines, int exitCode)
      : lines_(std::move(lines)), exitCode_(exitCode) {}

  int run(const std::vector<std::string> &argv, const LineCallback &onLine,
          const CancellationToken &) override {
    argv_ = argv;
    for (const auto &line : lines_)
      onLine(line);
    return exitCode_;
  }

  std::vector<std::string> argv_;

private:
  std::vector<std::string> lines_;
  int exitCode_;
};

} // namespace

void testBatchSizeIndependence() {
  std::cout << "=== Test 1: output does not depend on batch size ==="
            << std::endl;

  std::vector<Document> docs = sampleDocuments(2500);
  for (TransferFormat format :
       {TransferFormat::JSON_LINES, TransferFormat::JSON_ARRAY,
        TransferFormat::CSV}) {
    std::string one = exportToString(docs, format, 1);
    std::string small = exportToString(docs, format, 7);
    std::string large = exportToString(docs, format, 1000);
    assert(one == small);
    assert(one == large);
    assert(!one.empty());
  }

  std::string csv = exportToString(docs, TransferFormat::CSV, 1000);
  assert(csv.compare(0, 27, "_id,name,nested.v,rare\n0,n0") == 0);

  std::cout << "✅ Batch sizes 1, 7 and 1000 produce identical bytes"
            << std::endl;
}

void testRoundTripThroughFiles() {
  std::cout << "\n=== Test 2: export then import ===" << std::endl;

  std::vector<Document> docs = sampleDocuments(100);
  for (TransferFormat format :
       {TransferFormat::JSON_LINES, TransferFormat::JSON_ARRAY,
        TransferFormat::CSV}) {
    std::string text = exportToString(docs, format, 33);

    TransferJob job = memoryJob(format);
    auto collection = std::make_shared<MemoryCollection>();
    std::vector<TransferUnit> units;
    units.push_back(
        unit(StreamDocumentSource::fromString(text, format,
                                              job.options.codecOptions()),
             std::make_unique<MemoryDocumentSink>(collection,
                                                  InsertMode::INSERT)));
    TransferOutcome outcome = runUnits(job, std::move(units));
    assert(outcome.state == TransferState::COMPLETED);
    assert(outcome.committed == 100);
    assert(outcome.failed == 0);

    std::vector<Document> back = collection->snapshot();
    if (format == TransferFormat::CSV) {
      // Absent columns read back as absent fields.
      assert(back[1] == docs[1]);
      assert(back[7] == docs[7]);
    } else {
      assert(back == docs);
    }
  }

  std::cout << "✅ Every document format reads back what it wrote"
            << std::endl;
}

void testOneBadLineInTenThousand() {
  std::cout << "\n=== Test 3: one malformed line ===" << std::endl;

  std::string text;
  for (int i = 0; i < 10000; ++i) {
    if (i == 5000)
      text += "{\"_id\": 5000, broken\n";
    else
      text += "{\"_id\":" + std::to_string(i) + "}\n";
  }

  TransferJob job = memoryJob();
  auto collection = std::make_shared<MemoryCollection>();
  std::vector<TransferUnit> units;
  units.push_back(unit(StreamDocumentSource::fromString(
                           text, TransferFormat::JSON_LINES,
                           job.options.codecOptions()),
                       std::make_unique<MemoryDocumentSink>(
                           collection, InsertMode::INSERT)));
  TransferOutcome outcome = runUnits(job, std::move(units));

  assert(outcome.state == TransferState::COMPLETED);
  assert(outcome.processed == 10000);
  assert(outcome.committed == 9999);
  assert(outcome.failed == 1);
  assert(outcome.errors.size() == 1);
  assert(outcome.errors[0].kind == RecordErrorKind::MALFORMED_JSON);
  assert(outcome.errors[0].offset == 5000);
  assert(outcome.errors[0].line == 5001);
  assert(collection->size() == 9999);

  std::cout << "✅ 9999 committed, the bad line reported with its position"
            << std::endl;
}

void testCancellationAtBatchBoundary() {
  std::cout << "\n=== Test 4: cancellation ===" << std::endl;

  std::vector<Document> docs = sampleDocuments(1000);
  TransferJob job = memoryJob(TransferFormat::JSON_ARRAY);
  job.options.batchSize = 100;
  CancellationToken cancel;
  auto output = std::make_shared<std::string>();

  std::vector<TransferUnit> units;
  units.push_back(unit(
      std::make_unique<MemoryDocumentSource>(docs),
      std::make_unique<CancellingSink>(
          StreamDocumentSink::toString(output, TransferFormat::JSON_ARRAY,
                                       job.options.codecOptions()),
          cancel, 3)));
  TransferOutcome outcome = runUnits(job, std::move(units), nullptr, cancel);

  assert(outcome.state == TransferState::CANCELLED);
  assert(outcome.committed == 300);
  assert(outcome.batches == 3);
  assert(!outcome.fatalKind.has_value());

  // The array is closed, so the partial output is still a valid file.
  auto reread = StreamDocumentSource::fromString(
      *output, TransferFormat::JSON_ARRAY, job.options.codecOptions());
  auto cursor = reread->open(0);
  ReadItem item;
  size_t count = 0;
  while (cursor->next(item)) {
    assert(item.ok());
    ++count;
  }
  assert(count == 300);

  CancellationToken early;
  early.cancel();
  auto untouched = std::make_shared<std::string>();
  std::vector<TransferUnit> lateUnits;
  lateUnits.push_back(unit(std::make_unique<MemoryDocumentSource>(docs),
                           StreamDocumentSink::toString(
                               untouched, TransferFormat::JSON_ARRAY,
                               job.options.codecOptions())));
  TransferOutcome none = runUnits(job, std::move(lateUnits), nullptr, early);
  assert(none.state == TransferState::CANCELLED);
  assert(none.committed == 0);
  assert(untouched->empty());

  std::cout << "✅ Cancel stops after the current batch and closes output"
            << std::endl;
}

void testInsertModes() {
  std::cout << "\n=== Test 5: insert modes ===" << std::endl;

  auto existing = [] {
    Document doc;
    doc.set("_id", Value(1));
    doc.set("a", Value("old"));
    doc.set("keep", Value(true));
    return std::make_shared<MemoryCollection>(std::vector<Document>{doc});
  };
  std::vector<Document> incoming = {
      ExtendedJson::parseDocument("{\"_id\":1,\"a\":\"new\"}"),
      ExtendedJson::parseDocument("{\"_id\":2,\"a\":\"x\"}")};

  {
    TransferJob job = memoryJob();
    auto collection = existing();
    std::vector<TransferUnit> units;
    units.push_back(unit(std::make_unique<MemoryDocumentSource>(incoming),
                         std::make_unique<MemoryDocumentSink>(
                             collection, InsertMode::INSERT)));
    TransferOutcome outcome = runUnits(job, std::move(units));
    assert(outcome.state == TransferState::COMPLETED);
    assert(outcome.committed == 1 && outcome.failed == 1);
    assert(outcome.errors[0].kind == RecordErrorKind::INSERT_CONFLICT);
    assert(outcome.errors[0].documentKey == "1");
    assert(outcome.errors[0].offset == 0);
    assert(collection->find(DocumentKey::fromId(Value(1)))->get("a")->asString() ==
           "old");
  }
  {
    TransferJob job = memoryJob();
    job.options.insertMode = InsertMode::UPSERT;
    auto collection = existing();
    std::vector<TransferUnit> units;
    units.push_back(unit(std::make_unique<MemoryDocumentSource>(incoming),
                         std::make_unique<MemoryDocumentSink>(
                             collection, InsertMode::UPSERT)));
    TransferOutcome outcome = runUnits(job, std::move(units));
    assert(outcome.committed == 2 && outcome.failed == 0);
    Document merged = *collection->find(DocumentKey::fromId(Value(1)));
    assert(merged.get("a")->asString() == "new");
    assert(merged.contains("keep"));
  }
  {
    TransferJob job = memoryJob();
    job.options.insertMode = InsertMode::REPLACE;
    auto collection = existing();
    std::vector<TransferUnit> units;
    units.push_back(unit(std::make_unique<MemoryDocumentSource>(incoming),
                         std::make_unique<MemoryDocumentSink>(
                             collection, InsertMode::REPLACE)));
    TransferOutcome outcome = runUnits(job, std::move(units));
    assert(outcome.committed == 2);
    Document replaced = *collection->find(DocumentKey::fromId(Value(1)));
    assert(replaced == incoming[0]);
    assert(collection->size() == 2);
  }

  std::cout << "✅ INSERT reports conflicts, UPSERT merges, REPLACE swaps"
            << std::endl;
}

void testAbortOnFirstError() {
  std::cout << "\n=== Test 6: abort on first error ===" << std::endl;

  TransferJob job = memoryJob();
  job.options.abortOnFirstError = true;
  job.options.batchSize = 10;
  auto collection = std::make_shared<MemoryCollection>();
  std::vector<TransferUnit> units;
  units.push_back(unit(
      StreamDocumentSource::fromString(
          "{\"_id\":1}\n{\"_id\":2}\n{oops\n{\"_id\":4}\n{\"_id\":5}\n",
          TransferFormat::JSON_LINES, job.options.codecOptions()),
      std::make_unique<MemoryDocumentSink>(collection, InsertMode::INSERT)));
  TransferOutcome outcome = runUnits(job, std::move(units));

  assert(outcome.state == TransferState::FAILED);
  assert(outcome.fatalKind == TransferErrorKind::ABORTED_ON_RECORD_ERROR);
  assert(outcome.committed == 2);
  assert(outcome.failed == 1);
  assert(outcome.errors[0].line == 3);
  assert(collection->size() == 2);

  std::cout << "✅ The run stops at the first bad record" << std::endl;
}

void testLimitAcrossUnits() {
  std::cout << "\n=== Test 7: limit ===" << std::endl;

  TransferJob job = memoryJob();
  job.options.limit = 20;
  job.options.batchSize = 8;
  auto first = std::make_shared<MemoryCollection>();
  auto second = std::make_shared<MemoryCollection>();
  auto third = std::make_shared<MemoryCollection>();

  std::vector<TransferUnit> units;
  units.push_back(unit(std::make_unique<MemoryDocumentSource>(sampleDocuments(15)),
                       std::make_unique<MemoryDocumentSink>(first, InsertMode::INSERT),
                       "first"));
  units.push_back(unit(std::make_unique<MemoryDocumentSource>(sampleDocuments(15)),
                       std::make_unique<MemoryDocumentSink>(second, InsertMode::INSERT),
                       "second"));
  units.push_back(unit(std::make_unique<MemoryDocumentSource>(sampleDocuments(15)),
                       std::make_unique<MemoryDocumentSink>(third, InsertMode::INSERT),
                       "third"));
  TransferOutcome outcome = runUnits(job, std::move(units));

  assert(outcome.state == TransferState::COMPLETED);
  assert(outcome.processed == 20);
  assert(outcome.committed == 20);
  assert(first->size() == 15);
  assert(second->size() == 5);
  assert(third->size() == 0);
  assert(outcome.unitsCompleted == 2);

  std::cout << "✅ The limit spans every unit of the job" << std::endl;
}

void testBoundedErrors() {
  std::cout << "\n=== Test 8: bounded error list ===" << std::endl;

  std::string text;
  for (int i = 0; i < 30; ++i)
    text += "[" + std::to_string(i) + "]\n";

  TransferJob job = memoryJob();
  job.options.maxRecordedErrors = 5;
  std::vector<TransferUnit> units;
  units.push_back(unit(StreamDocumentSource::fromString(
                           text, TransferFormat::JSON_LINES,
                           job.options.codecOptions()),
                       std::make_unique<MemoryDocumentSink>(
                           std::make_shared<MemoryCollection>(),
                           InsertMode::INSERT)));
  TransferOutcome outcome = runUnits(job, std::move(units));

  assert(outcome.state == TransferState::COMPLETED);
  assert(outcome.failed == 30);
  assert(outcome.errors.size() == 5);
  assert(outcome.errorsTruncated);
  assert(outcome.errors[4].offset == 4);
  assert(outcome.committed == 0);

  std::cout << "✅ All errors counted, the first five kept" << std::endl;
}

void testProgressSnapshots() {
  std::cout << "\n=== Test 9: progress snapshots ===" << std::endl;

  TransferJob job = memoryJob();
  job.options.batchSize = 3;
  ProgressChannel progress(64);
  std::vector<TransferUnit> units;
  units.push_back(unit(std::make_unique<MemoryDocumentSource>(sampleDocuments(10)),
                       std::make_unique<MemoryDocumentSink>(
                           std::make_shared<MemoryCollection>(),
                           InsertMode::INSERT),
                       "people"));
  TransferOutcome outcome = runUnits(job, std::move(units), &progress);
  assert(outcome.batches == 4);

  std::vector<uint64_t> seen;
  ProgressSnapshot snapshot;
  while (progress.poll(snapshot)) {
    assert(snapshot.total == 10u);
    assert(snapshot.unitTotal == 10u);
    assert(snapshot.unitLabel == "people");
    assert(snapshot.unitProcessed == snapshot.processed);
    seen.push_back(snapshot.processed);
  }
  assert((seen == std::vector<uint64_t>{3, 6, 9, 10}));

  // Two collections: job counters keep growing across the unit boundary.
  TransferJob twoUnits = memoryJob();
  twoUnits.options.batchSize = 10;
  ProgressChannel channel(64);
  std::vector<TransferUnit> collections;
  for (const char *label : {"people", "orders"}) {
    collections.push_back(
        unit(std::make_unique<MemoryDocumentSource>(sampleDocuments(30)),
             std::make_unique<MemoryDocumentSink>(
                 std::make_shared<MemoryCollection>(), InsertMode::INSERT),
             label));
  }
  outcome = runUnits(twoUnits, std::move(collections), &channel);
  assert(outcome.processed == 60);

  std::vector<uint64_t> jobCounts;
  std::vector<uint64_t> unitCounts;
  std::vector<std::string> labels;
  while (channel.poll(snapshot)) {
    assert(snapshot.total == 60u);
    assert(snapshot.unitTotal == 30u);
    jobCounts.push_back(snapshot.processed);
    unitCounts.push_back(snapshot.unitProcessed);
    labels.push_back(snapshot.unitLabel);
  }
  assert((jobCounts == std::vector<uint64_t>{10, 20, 30, 40, 50, 60}));
  assert((unitCounts == std::vector<uint64_t>{10, 20, 30, 10, 20, 30}));
  assert(labels[2] == "people" && labels[3] == "orders");

  // An unknown estimate leaves the job total open.
  TransferJob streamed = memoryJob();
  streamed.options.batchSize = 5;
  ProgressChannel streamedProgress(64);
  std::vector<TransferUnit> mixed;
  mixed.push_back(unit(std::make_unique<MemoryDocumentSource>(sampleDocuments(5)),
                       std::make_unique<MemoryDocumentSink>(
                           std::make_shared<MemoryCollection>(),
                           InsertMode::INSERT)));
  mixed.push_back(unit(StreamDocumentSource::fromString(
                           "{\"a\":1}\n", TransferFormat::JSON_LINES,
                           streamed.options.codecOptions()),
                       std::make_unique<MemoryDocumentSink>(
                           std::make_shared<MemoryCollection>(),
                           InsertMode::INSERT)));
  outcome = runUnits(streamed, std::move(mixed), &streamedProgress);
  assert(outcome.processed == 6);
  uint64_t last = 0;
  while (streamedProgress.poll(snapshot)) {
    assert(!snapshot.total.has_value());
    last = snapshot.processed;
  }
  assert(last == 6);

  std::cout << "✅ One snapshot per batch with the estimated total"
            << std::endl;
}

void testCsvSampleDiscovery() {
  std::cout << "\n=== Test 10: sampled CSV columns ===" << std::endl;

  std::vector<Document> docs = {
      ExtendedJson::parseDocument("{\"a\":1}"),
      ExtendedJson::parseDocument("{\"a\":2}"),
      ExtendedJson::parseDocument("{\"a\":3,\"b\":4}")};

  TransferJob job = memoryJob(TransferFormat::CSV);
  job.options.columnDiscovery = ColumnDiscoveryMode::SAMPLE;
  job.options.sampleSize = 2;
  auto output = std::make_shared<std::string>();
  std::vector<TransferUnit> units;
  units.push_back(unit(std::make_unique<MemoryDocumentSource>(docs),
                       StreamDocumentSink::toString(output, TransferFormat::CSV,
                                                    job.options.codecOptions())));
  TransferOutcome outcome = runUnits(job, std::move(units));
  assert(outcome.state == TransferState::COMPLETED);
  assert(outcome.committed == 3);
  assert(*output == "a\n1\n2\n3\n");

  job.options.unseenColumns = UnseenColumnPolicy::APPEND;
  std::vector<TransferUnit> appendUnits;
  appendUnits.push_back(unit(std::make_unique<MemoryDocumentSource>(docs),
                             StreamDocumentSink::toString(
                                 std::make_shared<std::string>(),
                                 TransferFormat::CSV,
                                 job.options.codecOptions())));
  TransferOutcome rejected = runUnits(job, std::move(appendUnits));
  assert(rejected.state == TransferState::FAILED);
  assert(rejected.fatalKind == TransferErrorKind::MALFORMED_JOB);

  std::cout << "✅ Sampled header drops later columns, APPEND is refused"
            << std::endl;
}

void testFatalSinkError() {
  std::cout << "\n=== Test 11: destination failure ===" << std::endl;

  TransferJob job = memoryJob();
  job.options.batchSize = 4;
  bool closed = false;
  std::vector<TransferUnit> units;
  units.push_back(unit(std::make_unique<MemoryDocumentSource>(sampleDocuments(10)),
                       std::make_unique<FailingSink>(closed)));
  TransferOutcome outcome = runUnits(job, std::move(units));

  assert(outcome.state == TransferState::FAILED);
  assert(outcome.fatalKind == TransferErrorKind::DESTINATION_UNAVAILABLE);
  assert(outcome.fatalMessage == "connection reset");
  assert(outcome.committed == 4);
  assert(closed);

  std::cout << "✅ Fatal sink errors fail the job and keep earlier batches"
            << std::endl;
}

void testValidationAndSingleUse() {
  std::cout << "\n=== Test 12: validation and single use ===" << std::endl;

  TransferJob job = memoryJob();
  job.options.batchSize = 0;
  std::vector<TransferUnit> units;
  units.push_back(unit(std::make_unique<MemoryDocumentSource>(sampleDocuments(1)),
                       std::make_unique<MemoryDocumentSink>(
                           std::make_shared<MemoryCollection>(),
                           InsertMode::INSERT)));
  TransferOutcome outcome = runUnits(job, std::move(units));
  assert(outcome.state == TransferState::FAILED);
  assert(outcome.fatalKind == TransferErrorKind::MALFORMED_JOB);

  TransferOutcome empty = runUnits(memoryJob(), {});
  assert(empty.state == TransferState::FAILED);
  assert(empty.fatalKind == TransferErrorKind::MALFORMED_JOB);

  TransferPipeline pipeline(std::vector<TransferUnit>{});
  ProgressChannel progress(4);
  CancellationToken cancel;
  pipeline.run(memoryJob(), progress, cancel);
  bool threw = false;
  try {
    pipeline.run(memoryJob(), progress, cancel);
  } catch (const TransferError &e) {
    threw = e.kind() == TransferErrorKind::MALFORMED_JOB;
  }
  assert(threw);

  std::cout << "✅ Bad options fail the job, a pipeline runs once"
            << std::endl;
}

void testArchiveRuns() {
  std::cout << "\n=== Test 13: archive tool runs ===" << std::endl;

  TransferJob job = memoryJob(TransferFormat::BSON_ARCHIVE);
  ArchiveCommand command;
  command.argv = {"/opt/tools/mongodump", "--uri", "mongodb://h", "--db", "shop"};
  command.direction = ArchiveDirection::DUMP;
  command.label = "shop";

  std::vector<std::string> lines = {
      "2024-05-01T10:00:00.000+0000\twriting shop.orders to archive 'x'",
      "2024-05-01T10:00:01.000+0000\t[#####...................]  shop.orders  "
      "250/1000  (25.0%)",
      "2024-05-01T10:00:02.000+0000\tdone dumping shop.orders (1000 documents)",
      "2024-05-01T10:00:02.000+0000\twriting shop.users to archive 'x'",
      "2024-05-01T10:00:03.000+0000\tdone dumping shop.users (40 documents)"};

  {
    auto tool = std::make_unique<FakeArchiveTool>(lines, 0);
    FakeArchiveTool *raw = tool.get();
    TransferPipeline pipeline(std::move(tool), command);
    assert(pipeline.isArchiveRun());
    ProgressChannel progress(64);
    TransferOutcome outcome = pipeline.run(job, progress, CancellationToken());

    assert(outcome.state == TransferState::COMPLETED);
    assert(outcome.committed == 1040);
    assert(outcome.unitsCompleted == 2);
    assert(raw->argv_ == command.argv);

    ProgressSnapshot snapshot;
    assert(progress.poll(snapshot) && snapshot.unitLabel == "orders" &&
           snapshot.processed == 0);
    assert(progress.poll(snapshot) && snapshot.processed == 250 &&
           snapshot.unitProcessed == 250 && snapshot.unitTotal == 1000u &&
           !snapshot.total.has_value());
    assert(progress.poll(snapshot) && snapshot.processed == 1000);
    assert(progress.poll(snapshot) && snapshot.unitLabel == "users" &&
           snapshot.processed == 1000 && snapshot.unitProcessed == 0);
    assert(progress.poll(snapshot) && snapshot.processed == 1040 &&
           snapshot.unitProcessed == 40);
    assert(!progress.poll(snapshot));
  }
  {
    std::vector<std::string> failing = {
        "2024-05-01T10:00:00.000+0000\tFailed: connection refused"};
    TransferPipeline pipeline(std::make_unique<FakeArchiveTool>(failing, 1),
                              command);
    ProgressChannel progress(4);
    TransferOutcome outcome = pipeline.run(job, progress, CancellationToken());
    assert(outcome.state == TransferState::FAILED);
    assert(outcome.fatalKind == TransferErrorKind::EXTERNAL_TOOL);
    assert(outcome.fatalMessage.find("mongodump failed with exit code 1") == 0);
    assert(outcome.fatalMessage.find("connection refused") !=
           std::string::npos);
  }
  {
    TransferJob wrongFormat = memoryJob(TransferFormat::JSON_LINES);
    TransferPipeline pipeline(std::make_unique<FakeArchiveTool>(lines, 0),
                              command);
    ProgressChannel progress(4);
    TransferOutcome outcome =
        pipeline.run(wrongFormat, progress, CancellationToken());
    assert(outcome.fatalKind == TransferErrorKind::MALFORMED_JOB);
  }

  std::cout << "✅ Tool output drives progress and exit codes map to errors"
            << std::endl;
}

int main() {
  std::cout << "Running transfer pipeline tests...\n" << std::endl;

  testBatchSizeIndependence();
  testRoundTripThroughFiles();
  testOneBadLineInTenThousand();
  testCancellationAtBatchBoundary();
  testInsertModes();
  testAbortOnFirstError();
  testLimitAcrossUnits();
  testBoundedErrors();
  testProgressSnapshots();
  testCsvSampleDiscovery();
  testFatalSinkError();
  testValidationAndSingleUse();
  testArchiveRuns();

  std::cout << "\n✅ All transfer pipeline tests passed!" << std::endl;
  return 0;
}
