#include "tools/archive_progress_parser.h"
#include "tools/archive_tool.h"
#include "transfer/transfer_errors.h"
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>

namespace {

const std::string TS = "2024-05-01T10:00:00.123+0000\t";

bool contains(const std::vector<std::string> &args, const std::string &arg) {
  return std::find(args.begin(), args.end(), arg) != args.end();
}

TransferJob dumpJob() {
  TransferJob job;
  job.format = TransferFormat::BSON_ARCHIVE;
  job.scope = TransferScope::DATABASE;
  job.source = EndpointDescriptor::mongo("mongodb://localhost:27017", "shop");
  job.destination = EndpointDescriptor::file("backups/shop");
  return job;
}

} // namespace

void testDumpLines() {
  std::cout << "Testing ArchiveProgressParser - dump output...\n";

  auto started = ArchiveProgressParser::parse(
      ArchiveDirection::DUMP, TS + "writing shop.orders to archive 'shop.archive'");
  assert(started && started->kind == ArchiveEventKind::STARTED);
  assert(started->collection == "orders");

  auto progress = ArchiveProgressParser::parse(
      ArchiveDirection::DUMP,
      TS + "[##########..............]  shop.orders  4200/10000  (42.0%)");
  assert(progress && progress->kind == ArchiveEventKind::PROGRESS);
  assert(progress->current == 4200 && progress->total == 10000);
  assert(progress->percent == 42.0);

  auto done = ArchiveProgressParser::parse(
      ArchiveDirection::DUMP, TS + "done dumping shop.orders (10000 documents)");
  assert(done && done->kind == ArchiveEventKind::COMPLETED);
  assert(done->documents == 10000 && done->failures == 0);
  assert(done->percent == 100.0);

  std::cout << "✓ Dump output test passed\n";
}

void testRestoreLines() {
  std::cout << "Testing ArchiveProgressParser - restore output...\n";

  auto started = ArchiveProgressParser::parse(
      ArchiveDirection::RESTORE,
      TS + "restoring shop.users from archive 'shop.archive'");
  assert(started && started->collection == "users");

  auto progress = ArchiveProgressParser::parse(
      ArchiveDirection::RESTORE,
      TS + "[#####...................]  shop.users  6.46MB/34.8MB  (18.6%)");
  assert(progress && progress->current == 6460000);
  assert(progress->total == 34800000);

  auto done = ArchiveProgressParser::parse(
      ArchiveDirection::RESTORE,
      TS + "finished restoring shop.users (500 documents, 3 failures)");
  assert(done && done->documents == 500 && done->failures == 3);

  assert(!ArchiveProgressParser::parse(ArchiveDirection::RESTORE,
                                       TS + "writing shop.users to x"));
  assert(!ArchiveProgressParser::parse(ArchiveDirection::DUMP,
                                       "no timestamp or tab here"));
  assert(!ArchiveProgressParser::parse(ArchiveDirection::DUMP,
                                       TS + "Failed: connection refused"));

  std::cout << "✓ Restore output test passed\n";
}

void testParseSize() {
  std::cout << "Testing ArchiveProgressParser - sizes...\n";

  assert(ArchiveProgressParser::parseSize("12B") == 12u);
  assert(ArchiveProgressParser::parseSize("455KB") == 455000u);
  assert(ArchiveProgressParser::parseSize("1.5GB") == 1500000000u);
  assert(ArchiveProgressParser::parseSize("7") == 7u);
  assert(!ArchiveProgressParser::parseSize("MB").has_value());
  assert(!ArchiveProgressParser::parseSize("3PB").has_value());

  std::cout << "✓ Size parsing test passed\n";
}

void testDumpCommand() {
  std::cout << "Testing ArchiveCommandBuilder - dump...\n";

  TransferJob job = dumpJob();
  job.options.gzip = true;
  job.source.excludeCollections = {"logs"};
  ArchiveCommand command = ArchiveCommandBuilder::build(job, "/usr/bin/mongodump");

  assert(command.direction == ArchiveDirection::DUMP);
  assert(command.label == "shop");
  assert(command.argv[0] == "/usr/bin/mongodump");
  assert(contains(command.argv, "--gzip"));
  assert(contains(command.argv, "--excludeCollection"));
  assert(contains(command.argv, "--archive=backups/shop.archive"));
  assert(!contains(command.argv, "--collection"));

  TransferJob single = dumpJob();
  single.scope = TransferScope::COLLECTION;
  single.source.collection = "orders";
  single.options.archiveAsFolder = true;
  ArchiveCommand folder = ArchiveCommandBuilder::build(single, "mongodump");
  assert(folder.label == "orders");
  assert(contains(folder.argv, "--collection"));
  assert(contains(folder.argv, "--out"));

  assert(ArchiveCommandBuilder::archivePath("x/y.archive") == "x/y.archive");
  assert(ArchiveCommandBuilder::archivePath("x/y.bson") == "x/y.archive");

  std::cout << "✓ Dump command test passed\n";
}

void testRestoreCommand() {
  std::cout << "Testing ArchiveCommandBuilder - restore...\n";

  TransferJob job;
  job.format = TransferFormat::BSON_ARCHIVE;
  job.scope = TransferScope::DATABASE;
  job.source = EndpointDescriptor::file("shop.archive");
  job.destination =
      EndpointDescriptor::mongo("mongodb://localhost:27017", "shop_copy");
  job.options.dropBeforeRestore = true;

  ArchiveCommand archive = ArchiveCommandBuilder::build(job, "mongorestore");
  assert(archive.direction == ArchiveDirection::RESTORE);
  assert(contains(archive.argv, "--drop"));
  assert(contains(archive.argv, "--archive=shop.archive"));

  std::filesystem::path dir =
      std::filesystem::temp_directory_path() / "doctransfer_restore_test";
  std::filesystem::create_directories(dir / "shop_copy");
  job.source = EndpointDescriptor::file(dir.string());
  ArchiveCommand folder = ArchiveCommandBuilder::build(job, "mongorestore");
  assert(contains(folder.argv, "--dir"));
  assert(contains(folder.argv, (dir / "shop_copy").string()));
  std::filesystem::remove_all(dir);

  std::cout << "✓ Restore command test passed\n";
}

void testRejectedCommands() {
  std::cout << "Testing ArchiveCommandBuilder - rejected jobs...\n";

  auto rejects = [](const TransferJob &job) {
    try {
      ArchiveCommandBuilder::build(job, "tool");
    } catch (const TransferError &e) {
      return e.kind() == TransferErrorKind::MALFORMED_JOB;
    }
    return false;
  };

  TransferJob fileToFile;
  fileToFile.source = EndpointDescriptor::file("a.archive");
  fileToFile.destination = EndpointDescriptor::file("b.archive");
  assert(rejects(fileToFile));

  TransferJob noDatabase = dumpJob();
  noDatabase.source.database.clear();
  assert(rejects(noDatabase));

  TransferJob noPath = dumpJob();
  noPath.destination.path.clear();
  assert(rejects(noPath));

  std::cout << "✓ Rejected jobs test passed\n";
}

int main() {
  std::cout << "Running archive tool tests...\n\n";

  testDumpLines();
  testRestoreLines();
  testParseSize();
  testDumpCommand();
  testRestoreCommand();
  testRejectedCommands();

  std::cout << "\n✓ All archive tool tests passed!\n";
  return 0;
}
