#ifndef EXTERNAL_ARCHIVE_TOOL_H
#define EXTERNAL_ARCHIVE_TOOL_H

#include "tools/archive_tool.h"

// Spawns argv[0] with fork/execvp. stdout and stderr share one pipe so
// lines reach the callback in the order the tool wrote them. A cancelled
// token sends SIGTERM to the child; the output is drained and the child
// reaped either way.
class ExternalArchiveTool : public IArchiveTool {
public:
  explicit ExternalArchiveTool(int pollIntervalMs = 100)
      : pollIntervalMs_(pollIntervalMs) {}

  int run(const std::vector<std::string> &argv, const LineCallback &onLine,
          const CancellationToken &cancel) override;

private:
  int pollIntervalMs_;
};

#endif
