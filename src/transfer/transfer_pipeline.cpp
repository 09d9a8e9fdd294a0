#include "transfer/transfer_pipeline.h"
#include "core/logger.h"
#include "core/transfer_config.h"
#include "document/document_key.h"
#include "flatten/column_discovery.h"
#include <algorithm>
#include <chrono>
#include <deque>
#include <filesystem>

namespace {

constexpr size_t ARCHIVE_OUTPUT_TAIL = 20;

// Replays the documents buffered for sample discovery before continuing
// with the underlying cursor.
class BufferedCursor : public DocumentCursor {
public:
  BufferedCursor(std::deque<ReadItem> buffered,
                 std::unique_ptr<DocumentCursor> rest)
      : buffered_(std::move(buffered)), rest_(std::move(rest)) {}

  bool next(ReadItem &item) override {
    if (!buffered_.empty()) {
      item = std::move(buffered_.front());
      buffered_.pop_front();
      return true;
    }
    if (exhausted_)
      return false;
    if (!rest_->next(item)) {
      exhausted_ = true;
      return false;
    }
    return true;
  }

private:
  std::deque<ReadItem> buffered_;
  std::unique_ptr<DocumentCursor> rest_;
  bool exhausted_ = false;
};

void closeAfterFailure(IDocumentSink &sink) {
  try {
    sink.close();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::TRANSFER, "TransferPipeline::runUnit",
                  "Error closing " + sink.describe() +
                      " after failure: " + std::string(e.what()));
  }
}

} // namespace

struct TransferPipeline::RunContext {
  RunContext(const TransferJob &job, ProgressChannel &progress,
             const CancellationToken &cancel)
      : job(job), progress(progress), cancel(cancel),
        errors(std::max<size_t>(job.options.maxRecordedErrors, 1)) {}

  // Records still allowed by the job limit.
  std::optional<uint64_t> remaining() const {
    if (!job.options.limit)
      return std::nullopt;
    return *job.options.limit > outcome.processed
               ? *job.options.limit - outcome.processed
               : 0;
  }

  void addError(RecordError error) {
    Logger::debug(LogCategory::TRANSFER, "TransferPipeline::runUnit",
                  error.describe());
    if (!firstError)
      firstError = error.describe();
    errors.add(std::move(error));
  }

  const TransferJob &job;
  ProgressChannel &progress;
  const CancellationToken &cancel;
  TransferOutcome outcome;
  ErrorCollector errors;
  std::optional<std::string> firstError;
  uint64_t toolFailures = 0;
  // Records the whole job expects, known when every unit has an estimate.
  std::optional<uint64_t> jobTotal;
};

TransferPipeline::TransferPipeline(std::vector<TransferUnit> units)
    : units_(std::move(units)) {}

TransferPipeline::TransferPipeline(std::unique_ptr<IArchiveTool> tool,
                                   ArchiveCommand command)
    : archiveTool_(std::move(tool)), archiveCommand_(std::move(command)) {}

void TransferPipeline::validate(const TransferJob &job) const {
  const TransferOptions &options = job.options;
  if (options.batchSize < TransferConfig::MIN_BATCH_SIZE ||
      options.batchSize > TransferConfig::MAX_BATCH_SIZE) {
    throw TransferError(
        TransferErrorKind::MALFORMED_JOB,
        "batchSize must be between " +
            std::to_string(TransferConfig::MIN_BATCH_SIZE) + " and " +
            std::to_string(TransferConfig::MAX_BATCH_SIZE));
  }
  if (options.maxRecordedErrors < TransferConfig::MIN_RECORDED_ERRORS) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "maxRecordedErrors must be at least 1");
  }
  if (options.columnDiscovery == ColumnDiscoveryMode::SAMPLE &&
      options.sampleSize == 0) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "sampleSize must be at least 1");
  }

  if (archiveTool_) {
    if (job.format != TransferFormat::BSON_ARCHIVE) {
      throw TransferError(TransferErrorKind::MALFORMED_JOB,
                          "archive tool runs require the archive format");
    }
    if (archiveCommand_.argv.empty()) {
      throw TransferError(TransferErrorKind::MALFORMED_JOB,
                          "archive command is empty");
    }
    return;
  }

  bool storeToStore = job.source.kind == EndpointKind::MONGODB &&
                      job.destination.kind == EndpointKind::MONGODB;
  if (job.format == TransferFormat::BSON_ARCHIVE && !storeToStore) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "archive transfers are performed by the external "
                        "archive tool");
  }
  if (units_.empty()) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "job " + job.id + " has nothing to transfer");
  }
  for (const auto &unit : units_) {
    if (!unit.source || !unit.sink) {
      throw TransferError(TransferErrorKind::MALFORMED_JOB,
                          "transfer unit " + unit.label +
                              " is missing its source or sink");
    }
    if (unit.sink->requiresColumnSchema() &&
        options.columnDiscovery == ColumnDiscoveryMode::SAMPLE &&
        options.unseenColumns == UnseenColumnPolicy::APPEND) {
      throw TransferError(TransferErrorKind::MALFORMED_JOB,
                          "appending unseen columns is not possible once "
                          "the CSV header is written");
    }
  }
}

TransferOutcome TransferPipeline::run(const TransferJob &job,
                                      ProgressChannel &progress,
                                      const CancellationToken &cancel) {
  if (used_.exchange(true)) {
    throw TransferError(TransferErrorKind::MALFORMED_JOB,
                        "transfer pipeline has already been run");
  }

  RunContext ctx(job, progress, cancel);
  ctx.outcome.state = TransferState::RUNNING;
  auto startTime = std::chrono::steady_clock::now();

  Logger::info(LogCategory::TRANSFER, "TransferPipeline::run",
               "Starting job " + job.id + ": " + job.source.describe() +
                   " -> " + job.destination.describe() + " (" +
                   formatName(job.format) + ")");

  try {
    validate(job);

    if (archiveTool_) {
      runArchive(ctx);
    } else {
      std::vector<std::optional<uint64_t>> estimates;
      estimates.reserve(units_.size());
      uint64_t expected = 0;
      bool allKnown = true;
      for (auto &unit : units_) {
        estimates.push_back(unit.source->estimatedCount());
        if (estimates.back())
          expected += *estimates.back();
        else
          allKnown = false;
      }
      if (allKnown) {
        ctx.jobTotal = job.options.limit
                           ? std::min<uint64_t>(expected, *job.options.limit)
                           : expected;
      }

      bool cancelled = false;
      for (size_t i = 0; i < units_.size(); ++i) {
        auto remaining = ctx.remaining();
        if (remaining && *remaining == 0)
          break;
        if (!runUnit(units_[i], estimates[i], ctx)) {
          cancelled = true;
          break;
        }
      }
      ctx.outcome.state =
          cancelled ? TransferState::CANCELLED : TransferState::COMPLETED;
    }
  } catch (const TransferError &e) {
    ctx.outcome.state = TransferState::FAILED;
    ctx.outcome.fatalKind = e.kind();
    ctx.outcome.fatalMessage = e.what();
    Logger::error(LogCategory::TRANSFER, "TransferPipeline::run",
                  "Job " + job.id + " failed (" +
                      transferErrorKindName(e.kind()) + "): " + e.what());
  } catch (const std::exception &e) {
    ctx.outcome.state = TransferState::FAILED;
    ctx.outcome.fatalKind = TransferErrorKind::INTERNAL;
    ctx.outcome.fatalMessage = e.what();
    Logger::error(LogCategory::TRANSFER, "TransferPipeline::run",
                  "Job " + job.id + " failed with unexpected error: " +
                      std::string(e.what()));
  }

  ctx.outcome.failed = ctx.errors.total() + ctx.toolFailures;
  ctx.outcome.errorsTruncated = ctx.errors.truncated();
  ctx.outcome.errors = ctx.errors.takeErrors();
  ctx.outcome.elapsedSeconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                    startTime)
          .count();

  Logger::info(LogCategory::TRANSFER, "TransferPipeline::run",
               "Job " + job.id + " finished: " + ctx.outcome.summary());
  return ctx.outcome;
}

bool TransferPipeline::runUnit(TransferUnit &unit,
                               std::optional<uint64_t> estimate,
                               RunContext &ctx) {
  const TransferOptions &options = ctx.job.options;
  IDocumentSource &source = *unit.source;
  IDocumentSink &sink = *unit.sink;
  const std::optional<uint64_t> budget = ctx.remaining();

  std::optional<uint64_t> total = estimate;
  if (total && budget)
    total = std::min(*total, *budget);

  Logger::info(LogCategory::TRANSFER, "TransferPipeline::runUnit",
               "Transferring " + source.describe() + " -> " +
                   sink.describe() +
                   (total ? " (" + std::to_string(*total) + " documents)"
                          : ""));

  if (ctx.cancel.isCancelled())
    return false;

  std::unique_ptr<DocumentCursor> cursor;
  std::optional<ColumnSchema> schema;

  if (sink.requiresColumnSchema()) {
    CsvFlattener flattener(options.flatten);
    ColumnDiscovery discovery(flattener);

    if (options.columnDiscovery == ColumnDiscoveryMode::FULL_SCAN) {
      std::unique_ptr<DocumentCursor> scan = source.open(0);
      uint64_t seen = 0;
      while (!budget || seen < *budget) {
        ReadItem item;
        if (!scan->next(item))
          break;
        ++seen;
        if (item.ok())
          discovery.observe(item.document);
        if (seen % options.batchSize == 0 && ctx.cancel.isCancelled())
          return false;
      }
      cursor = source.open(0);
    } else {
      cursor = source.open(0);
      uint64_t sampleLimit = options.sampleSize;
      if (budget)
        sampleLimit = std::min<uint64_t>(sampleLimit, *budget);
      std::deque<ReadItem> buffered;
      while (buffered.size() < sampleLimit) {
        ReadItem item;
        if (!cursor->next(item))
          break;
        if (item.ok())
          discovery.observe(item.document);
        buffered.push_back(std::move(item));
      }
      cursor = std::make_unique<BufferedCursor>(std::move(buffered),
                                                std::move(cursor));
    }

    schema = discovery.schema();
    Logger::info(LogCategory::FLATTEN, "TransferPipeline::runUnit",
                 "Discovered " + std::to_string(schema->size()) +
                     " columns from " +
                     std::to_string(discovery.observedCount()) +
                     " documents");
    for (const auto &lossy : discovery.lossyFields()) {
      Logger::warning(LogCategory::FLATTEN, "TransferPipeline::runUnit",
                      "Column '" + lossy.path + "' holds " +
                          valueTypeName(lossy.sourceType) +
                          " values that import back as " + lossy.importedAs);
    }
  } else {
    cursor = source.open(0);
  }

  sink.open(schema ? &*schema : nullptr);

  bool closed = false;
  try {
    uint64_t unitProcessed = 0;
    bool exhausted = false;

    while (!exhausted) {
      if (budget && unitProcessed >= *budget)
        break;

      std::vector<Document> batch;
      std::vector<uint64_t> offsets;
      batch.reserve(std::min<size_t>(options.batchSize, 4096));
      size_t consumed = 0;
      bool abort = false;

      while (consumed < options.batchSize) {
        if (budget && unitProcessed >= *budget)
          break;
        ReadItem item;
        if (!cursor->next(item)) {
          exhausted = true;
          break;
        }
        uint64_t offset = unitProcessed++;
        ++consumed;
        ++ctx.outcome.processed;

        if (!item.ok()) {
          RecordError error = std::move(*item.error);
          error.offset = offset;
          if (error.line == 0)
            error.line = item.line;
          if (error.documentKey.empty())
            error.documentKey = "index:" + std::to_string(offset);
          ctx.addError(std::move(error));
          if (options.abortOnFirstError) {
            abort = true;
            break;
          }
          continue;
        }
        offsets.push_back(offset);
        batch.push_back(std::move(item.document));
      }

      if (consumed == 0)
        break;

      if (!batch.empty()) {
        BatchWriteResult result = sink.writeBatch(batch);
        ctx.outcome.committed += result.written;
        for (const auto &failure : result.failures) {
          if (failure.index >= batch.size()) {
            throw TransferError(TransferErrorKind::INTERNAL,
                                sink.describe() +
                                    " reported a failure outside the batch");
          }
          RecordError error;
          error.kind = failure.kind;
          error.offset = offsets[failure.index];
          error.documentKey =
              DocumentKey::fromDocument(batch[failure.index],
                                        offsets[failure.index])
                  .str();
          error.message = failure.message;
          ctx.addError(std::move(error));
        }
        if (!result.failures.empty() && options.abortOnFirstError)
          abort = true;
      }

      ++ctx.outcome.batches;
      ctx.progress.publish(ProgressSnapshot{ctx.outcome.processed,
                                            ctx.jobTotal, unit.label,
                                            unitProcessed, total});

      if (abort) {
        throw TransferError(TransferErrorKind::ABORTED_ON_RECORD_ERROR,
                            "stopped at the first record error: " +
                                ctx.firstError.value_or("unknown"));
      }
      if (ctx.cancel.isCancelled()) {
        Logger::info(LogCategory::TRANSFER, "TransferPipeline::runUnit",
                     "Cancelled after " + std::to_string(unitProcessed) +
                         " records of " + unit.label);
        closed = true;
        sink.close();
        return false;
      }
    }

    closed = true;
    sink.close();
  } catch (...) {
    if (!closed)
      closeAfterFailure(sink);
    throw;
  }

  ++ctx.outcome.unitsCompleted;
  if (unit.afterCompletion)
    unit.afterCompletion();
  return true;
}

void TransferPipeline::runArchive(RunContext &ctx) {
  const ArchiveCommand &command = archiveCommand_;
  if (ctx.cancel.isCancelled()) {
    ctx.outcome.state = TransferState::CANCELLED;
    return;
  }

  std::deque<std::string> tail;
  std::string label = command.label;

  auto onLine = [&](const std::string &line) {
    tail.push_back(line);
    if (tail.size() > ARCHIVE_OUTPUT_TAIL)
      tail.pop_front();
    Logger::debug(LogCategory::TOOLS, "TransferPipeline::runArchive", line);

    auto event = ArchiveProgressParser::parse(command.direction, line);
    if (!event)
      return;
    if (!event->collection.empty())
      label = event->collection;

    switch (event->kind) {
    case ArchiveEventKind::STARTED:
      ctx.progress.publish(
          ProgressSnapshot{ctx.outcome.processed, std::nullopt, label});
      break;
    case ArchiveEventKind::PROGRESS: {
      // Dump progress counts documents; restore progress counts bytes and
      // only moves the unit fields.
      uint64_t processed = ctx.outcome.processed;
      if (command.direction == ArchiveDirection::DUMP)
        processed += event->current;
      ctx.progress.publish(ProgressSnapshot{processed, std::nullopt, label,
                                            event->current, event->total});
      break;
    }
    case ArchiveEventKind::COMPLETED: {
      uint64_t handled = event->documents + event->failures;
      ctx.outcome.committed += event->documents;
      ctx.outcome.processed += handled;
      ctx.toolFailures += event->failures;
      ++ctx.outcome.unitsCompleted;
      ctx.progress.publish(ProgressSnapshot{ctx.outcome.processed,
                                            std::nullopt, label, handled,
                                            handled});
      Logger::info(LogCategory::TOOLS, "TransferPipeline::runArchive",
                   "Finished " + label + ": " +
                       std::to_string(event->documents) + " documents, " +
                       std::to_string(event->failures) + " failures");
      break;
    }
    }
  };

  int exitCode = archiveTool_->run(command.argv, onLine, ctx.cancel);

  if (ctx.cancel.isCancelled()) {
    ctx.outcome.state = TransferState::CANCELLED;
    return;
  }
  if (exitCode != 0) {
    std::string tool =
        std::filesystem::path(command.argv.front()).filename().string();
    std::string message =
        tool + " failed with exit code " + std::to_string(exitCode);
    if (!tail.empty()) {
      message += ":";
      for (const auto &line : tail)
        message += "\n" + line;
    }
    throw TransferError(TransferErrorKind::EXTERNAL_TOOL, message);
  }
  ctx.outcome.state = TransferState::COMPLETED;
}
