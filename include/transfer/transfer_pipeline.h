#ifndef TRANSFER_PIPELINE_H
#define TRANSFER_PIPELINE_H

#include "tools/archive_tool.h"
#include "transfer/cancellation_token.h"
#include "transfer/document_sink.h"
#include "transfer/document_source.h"
#include "transfer/progress_channel.h"
#include "transfer/transfer_job.h"
#include "transfer/transfer_outcome.h"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// One source/sink pair of a job. A collection transfer has one unit; a
// database transfer has one per collection. afterCompletion runs once the
// sink has been closed successfully (index copy for store-to-store runs).
struct TransferUnit {
  std::string label;
  std::unique_ptr<IDocumentSource> source;
  std::unique_ptr<IDocumentSink> sink;
  std::function<void()> afterCompletion;
};

// Executes one job. A pipeline is single use: it owns its units, and a
// second run() throws TransferError(MALFORMED_JOB).
//
// Document runs read up to batchSize items, write them as one batch, record
// per-record failures, publish a progress snapshot and then look at the
// cancellation token. A cancelled run closes its sink, so file outputs stay
// well formed and contain exactly the committed batches. Fatal errors end
// the run as FAILED and keep whatever earlier batches already flushed.
//
// Archive runs hand the whole job to an IArchiveTool and turn its output
// lines into progress snapshots.
class TransferPipeline {
public:
  explicit TransferPipeline(std::vector<TransferUnit> units);
  TransferPipeline(std::unique_ptr<IArchiveTool> tool, ArchiveCommand command);

  TransferPipeline(const TransferPipeline &) = delete;
  TransferPipeline &operator=(const TransferPipeline &) = delete;

  TransferOutcome run(const TransferJob &job, ProgressChannel &progress,
                      const CancellationToken &cancel);

  bool isArchiveRun() const { return archiveTool_ != nullptr; }

private:
  struct RunContext;

  void validate(const TransferJob &job) const;
  // Returns false when the run was cancelled inside the unit.
  bool runUnit(TransferUnit &unit, std::optional<uint64_t> estimate,
               RunContext &ctx);
  void runArchive(RunContext &ctx);

  std::vector<TransferUnit> units_;
  std::unique_ptr<IArchiveTool> archiveTool_;
  ArchiveCommand archiveCommand_;
  std::atomic<bool> used_{false};
};

#endif
