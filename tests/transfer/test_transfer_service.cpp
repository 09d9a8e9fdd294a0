#include "core/logger.h"
#include "transfer/memory_endpoints.h"
#include "transfer/transfer_service.h"
#include <cassert>
#include <future>
#include <iostream>
#include <thread>

namespace {

// Memory source whose cursor blocks on the first read until the gate opens.
class GatedSource : public IDocumentSource {
public:
  GatedSource(std::vector<Document> documents, std::shared_future<void> gate)
      : documents_(std::move(documents)), gate_(std::move(gate)) {}

  std::unique_ptr<DocumentCursor> open(uint64_t offset) override {
    return std::make_unique<Cursor>(documents_, gate_, offset);
  }
  std::optional<uint64_t> estimatedCount() override {
    return documents_.size();
  }
  std::string describe() const override { return "gated"; }

private:
  class Cursor : public DocumentCursor {
  public:
    Cursor(const std::vector<Document> &documents,
           std::shared_future<void> gate, uint64_t offset)
        : documents_(documents), gate_(std::move(gate)), pos_(offset) {}

    bool next(ReadItem &item) override {
      gate_.wait();
      if (pos_ >= documents_.size())
        return false;
      item = ReadItem();
      item.document = documents_[pos_++];
      return true;
    }

  private:
    const std::vector<Document> &documents_;
    std::shared_future<void> gate_;
    uint64_t pos_;
  };

  std::vector<Document> documents_;
  std::shared_future<void> gate_;
};

std::vector<Document> numbered(size_t count) {
  std::vector<Document> docs;
  for (size_t i = 0; i < count; ++i) {
    Document doc;
    doc.set("_id", Value(static_cast<int32_t>(i)));
    docs.push_back(std::move(doc));
  }
  return docs;
}

TransferJob memoryJob(const std::string &destination) {
  TransferJob job;
  job.source = EndpointDescriptor::memory("source");
  job.destination = EndpointDescriptor::memory(destination);
  return job;
}

std::vector<TransferUnit> gatedUnits(size_t count,
                                     std::shared_future<void> gate,
                                     std::shared_ptr<MemoryCollection> target) {
  std::vector<TransferUnit> units;
  TransferUnit unit;
  unit.label = "gated";
  unit.source = std::make_unique<GatedSource>(numbered(count), std::move(gate));
  unit.sink = std::make_unique<MemoryDocumentSink>(std::move(target),
                                                   InsertMode::INSERT);
  units.push_back(std::move(unit));
  return units;
}

std::vector<TransferUnit> openUnits(size_t count,
                                    std::shared_ptr<MemoryCollection> target) {
  std::promise<void> open;
  open.set_value();
  return gatedUnits(count, open.get_future().share(), std::move(target));
}

class FailingFactory : public IEndpointFactory {
public:
  std::unique_ptr<TransferPipeline>
  createPipeline(const TransferJob &job) override {
    throw TransferError(TransferErrorKind::SOURCE_UNAVAILABLE,
                        "cannot reach " + job.source.describe());
  }
};

} // namespace

void testDuplicateDestinationRejected() {
  std::cout << "=== Test 1: one active job per destination ===" << std::endl;

  TransferService service(nullptr, 2);
  std::promise<void> gate;
  auto target = std::make_shared<MemoryCollection>();

  auto first = service.submit(memoryJob("orders"),
                              gatedUnits(5, gate.get_future().share(), target));
  assert(service.isDestinationActive(EndpointDescriptor::memory("orders")));

  bool busy = false;
  try {
    service.submit(memoryJob("orders"),
                   openUnits(1, std::make_shared<MemoryCollection>()));
  } catch (const TransferError &e) {
    busy = e.kind() == TransferErrorKind::DESTINATION_BUSY;
    assert(std::string(e.what()).find(first->jobId()) != std::string::npos);
  }
  assert(busy);

  auto other = service.submit(memoryJob("invoices"),
                              openUnits(3, std::make_shared<MemoryCollection>()));
  assert(other->wait().state == TransferState::COMPLETED);

  gate.set_value();
  TransferOutcome outcome = first->wait();
  assert(outcome.state == TransferState::COMPLETED);
  assert(outcome.committed == 5);
  assert(target->size() == 5);
  assert(!service.isDestinationActive(EndpointDescriptor::memory("orders")));

  auto again = service.submit(memoryJob("orders"),
                              openUnits(1, std::make_shared<MemoryCollection>()));
  assert(again->wait().state == TransferState::COMPLETED);

  std::cout << "✅ A busy destination is refused until its job finishes"
            << std::endl;
}

void testCompletionCallbacks() {
  std::cout << "\n=== Test 2: completion callbacks ===" << std::endl;

  TransferService service(nullptr, 1);
  std::promise<void> gate;
  auto handle = service.submit(
      memoryJob("callbacks"),
      gatedUnits(4, gate.get_future().share(),
                 std::make_shared<MemoryCollection>()));

  std::promise<uint64_t> delivered;
  handle->onComplete([&delivered](const TransferOutcome &outcome) {
    delivered.set_value(outcome.committed);
  });
  handle->onComplete([](const TransferOutcome &) {
    throw std::runtime_error("callback failure is logged, not propagated");
  });
  assert(!handle->isDone());
  assert(!handle->waitFor(std::chrono::milliseconds(20)).has_value());

  gate.set_value();
  auto future = delivered.get_future();
  assert(future.get() == 4);
  handle->wait();
  assert(handle->state() == TransferState::COMPLETED);

  bool immediate = false;
  handle->onComplete([&immediate](const TransferOutcome &outcome) {
    immediate = outcome.state == TransferState::COMPLETED;
  });
  assert(immediate && "late callbacks run right away");

  ProgressSnapshot snapshot;
  uint64_t last = 0;
  while (handle->progress().poll(snapshot))
    last = snapshot.processed;
  assert(last == 4);
  assert(handle->progress().isClosed());

  std::cout << "✅ Callbacks see the final outcome" << std::endl;
}

void testCancelRunningJob() {
  std::cout << "\n=== Test 3: cancel ===" << std::endl;

  TransferService service(nullptr, 1);
  std::promise<void> gate;
  auto target = std::make_shared<MemoryCollection>();
  TransferJob job = memoryJob("cancelled");
  job.options.batchSize = 10;

  auto handle =
      service.submit(job, gatedUnits(100, gate.get_future().share(), target));
  handle->cancel();
  gate.set_value();

  TransferOutcome outcome = handle->wait();
  assert(outcome.state == TransferState::CANCELLED);
  assert(outcome.committed <= 10);
  assert(target->size() == outcome.committed);

  std::cout << "✅ A cancelled job stops at a batch boundary" << std::endl;
}

void testFactoryErrors() {
  std::cout << "\n=== Test 4: factory errors ===" << std::endl;

  TransferService withoutFactory(nullptr, 1);
  bool threw = false;
  try {
    withoutFactory.submit(memoryJob("nowhere"));
  } catch (const TransferError &e) {
    threw = e.kind() == TransferErrorKind::MALFORMED_JOB;
  }
  assert(threw);

  TransferService service(std::make_shared<FailingFactory>(), 1);
  auto handle = service.submit(memoryJob("unreachable"));
  assert(handle->jobId().compare(0, 4, "job-") == 0);
  TransferOutcome outcome = handle->wait();
  assert(outcome.state == TransferState::FAILED);
  assert(outcome.fatalKind == TransferErrorKind::SOURCE_UNAVAILABLE);
  assert(service.activeJobs() == 0);

  std::cout << "✅ Endpoint failures surface as a FAILED outcome" << std::endl;
}

void testWorkerBoundsAndShutdown() {
  std::cout << "\n=== Test 5: worker bounds and shutdown ===" << std::endl;

  bool rejected = false;
  try {
    TransferService invalid(nullptr, 0);
  } catch (const std::invalid_argument &) {
    rejected = true;
  }
  assert(rejected);

  TransferService service(nullptr, 3);
  assert(service.totalWorkers() == 3);
  service.shutdown();
  service.shutdown();

  bool refused = false;
  try {
    service.submit(memoryJob("late"),
                   openUnits(1, std::make_shared<MemoryCollection>()));
  } catch (const TransferError &e) {
    refused = e.kind() == TransferErrorKind::INTERNAL;
  }
  assert(refused);

  std::cout << "✅ Worker count validated, shutdown refuses new jobs"
            << std::endl;
}

void testSubmitRacingShutdown() {
  std::cout << "\n=== Test 6: submit racing shutdown ===" << std::endl;

  Logger::setLogLevel(LogLevel::WARNING);
  size_t accepted = 0;
  for (int round = 0; round < 50; ++round) {
    TransferService service(nullptr, 2);
    std::vector<std::shared_ptr<TransferHandle>> handles;

    std::thread submitter([&] {
      for (int i = 0;; ++i) {
        try {
          handles.push_back(service.submit(
              memoryJob("race-" + std::to_string(i)),
              openUnits(5, std::make_shared<MemoryCollection>())));
        } catch (const TransferError &e) {
          assert(e.kind() == TransferErrorKind::INTERNAL);
          return;
        }
      }
    });

    std::this_thread::sleep_for(std::chrono::microseconds(200 * (round % 5)));
    service.shutdown();
    submitter.join();

    for (const auto &handle : handles) {
      assert(handle->isDone() && "every accepted job finishes on shutdown");
    }
    assert(service.activeJobs() == 0);
    accepted += handles.size();
  }
  Logger::setLogLevel(LogLevel::INFO);

  std::cout << "✅ " << accepted
            << " jobs accepted around shutdown, all of them finished"
            << std::endl;
}

int main() {
  std::cout << "Running transfer service tests...\n" << std::endl;

  testDuplicateDestinationRejected();
  testCompletionCallbacks();
  testCancelRunningJob();
  testFactoryErrors();
  testWorkerBoundsAndShutdown();
  testSubmitRacingShutdown();

  std::cout << "\n✅ All transfer service tests passed!" << std::endl;
  return 0;
}
