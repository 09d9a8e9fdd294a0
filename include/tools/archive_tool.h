#ifndef ARCHIVE_TOOL_H
#define ARCHIVE_TOOL_H

#include "tools/archive_progress_parser.h"
#include "transfer/cancellation_token.h"
#include "transfer/transfer_job.h"
#include <functional>
#include <string>
#include <vector>

using LineCallback = std::function<void(const std::string &)>;

// Runs an external dump/restore program. Every output line (stdout and
// stderr together) goes to onLine as it arrives. Returns the exit code;
// a process killed by a signal reports 128 + signal number.
class IArchiveTool {
public:
  virtual ~IArchiveTool() = default;

  virtual int run(const std::vector<std::string> &argv,
                  const LineCallback &onLine,
                  const CancellationToken &cancel) = 0;
};

struct ArchiveCommand {
  std::vector<std::string> argv;
  ArchiveDirection direction = ArchiveDirection::DUMP;
  // Progress label when the tool has not named a collection yet.
  std::string label;
};

class ArchiveCommandBuilder {
public:
  // MONGODB -> FILE becomes a dump, FILE -> MONGODB a restore. Anything
  // else throws TransferError(MALFORMED_JOB). toolPath is the resolved
  // executable for the direction.
  static ArchiveCommand build(const TransferJob &job,
                              const std::string &toolPath);

  static ArchiveDirection directionOf(const TransferJob &job);
  static const char *toolName(ArchiveDirection direction);

  // A dump into an archive file always ends in ".archive".
  static std::string archivePath(const std::string &path);
};

#endif
