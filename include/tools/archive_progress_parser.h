#ifndef ARCHIVE_PROGRESS_PARSER_H
#define ARCHIVE_PROGRESS_PARSER_H

#include <cstdint>
#include <optional>
#include <string>

enum class ArchiveDirection { DUMP, RESTORE };

enum class ArchiveEventKind { STARTED, PROGRESS, COMPLETED };

// One progress line of mongodump/mongorestore, already decoded. For a dump
// current/total count documents; for a restore they count bytes.
struct ArchiveEvent {
  ArchiveEventKind kind = ArchiveEventKind::PROGRESS;
  std::string collection;
  uint64_t current = 0;
  uint64_t total = 0;
  double percent = 0.0;
  uint64_t documents = 0;
  uint64_t failures = 0;
};

// Parses the verbose output of the dump and restore tools. Lines carry a
// timestamp, a tab, then one of:
//   writing db.coll to <path>
//   restoring db.coll from <path>
//   [####....]  db.coll  5/10  (50.0%)        (restore: 6.46MB/34.8MB)
//   done dumping db.coll (66985 documents)
//   finished restoring db.coll (500 documents, 0 failures)
// Anything else yields nullopt.
class ArchiveProgressParser {
public:
  static std::optional<ArchiveEvent> parse(ArchiveDirection direction,
                                           const std::string &line);

  // "6.46MB" -> 6460000, "455KB" -> 455000, "12B" -> 12.
  static std::optional<uint64_t> parseSize(const std::string &text);
};

#endif
