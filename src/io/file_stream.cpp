#include "io/file_stream.h"
#include "core/logger.h"
#include "transfer/transfer_errors.h"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <filesystem>

namespace {
std::string gzErrorText(gzFile file) {
  int code = 0;
  const char *message = gzerror(file, &code);
  if (code == Z_ERRNO)
    return std::strerror(errno);
  return message ? message : "unknown zlib error";
}

void ensureParentDirectory(const std::string &path) {
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (parent.empty())
    return;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "cannot create directory " + parent.string() + ": " +
                            ec.message());
  }
}
} // namespace

GzipFileReader::GzipFileReader(const std::string &path) : path_(path) {
  file_ = gzopen(path.c_str(), "rb");
  if (!file_) {
    throw TransferError(TransferErrorKind::SOURCE_UNAVAILABLE,
                        "cannot open " + path + ": " + std::strerror(errno));
  }
  gzbuffer(file_, 128 * 1024);
}

GzipFileReader::~GzipFileReader() {
  if (file_) {
    gzclose(file_);
  }
}

size_t GzipFileReader::read(char *buffer, size_t len) {
  unsigned chunk = static_cast<unsigned>(std::min<size_t>(len, INT_MAX));
  int n = gzread(file_, buffer, chunk);
  if (n < 0) {
    throw TransferError(TransferErrorKind::MALFORMED_SOURCE,
                        "read error in " + path_ + ": " + gzErrorText(file_));
  }
  return static_cast<size_t>(n);
}

PlainFileWriter::PlainFileWriter(const std::string &path) : path_(path) {
  ensureParentDirectory(path);
  file_.open(path, std::ios::binary | std::ios::trunc);
  if (!file_.is_open()) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "cannot open " + path + " for writing: " +
                            std::strerror(errno));
  }
}

PlainFileWriter::~PlainFileWriter() {
  if (file_.is_open()) {
    file_.close();
  }
}

void PlainFileWriter::write(std::string_view data) {
  file_.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!file_) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "write failed on " + path_);
  }
}

void PlainFileWriter::flush() {
  file_.flush();
  if (!file_) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "flush failed on " + path_);
  }
}

void PlainFileWriter::close() {
  if (!file_.is_open())
    return;
  file_.flush();
  bool ok = static_cast<bool>(file_);
  file_.close();
  if (!ok) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "close failed on " + path_);
  }
}

GzipFileWriter::GzipFileWriter(const std::string &path, int level)
    : path_(path) {
  ensureParentDirectory(path);
  std::string mode = "wb" + std::to_string(level < 0 || level > 9 ? 6 : level);
  file_ = gzopen(path.c_str(), mode.c_str());
  if (!file_) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "cannot open " + path + " for writing: " +
                            std::strerror(errno));
  }
}

GzipFileWriter::~GzipFileWriter() {
  if (file_) {
    if (gzclose(file_) != Z_OK) {
      Logger::error(LogCategory::TRANSFER, "GzipFileWriter",
                    "gzclose failed for " + path_);
    }
  }
}

void GzipFileWriter::write(std::string_view data) {
  if (!file_) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "write after close on " + path_);
  }
  size_t offset = 0;
  while (offset < data.size()) {
    unsigned chunk =
        static_cast<unsigned>(std::min<size_t>(data.size() - offset, 1 << 20));
    int written = gzwrite(file_, data.data() + offset, chunk);
    if (written <= 0) {
      throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                          "gzip write failed on " + path_ + ": " +
                              gzErrorText(file_));
    }
    offset += static_cast<size_t>(written);
  }
}

void GzipFileWriter::flush() {
  if (file_ && gzflush(file_, Z_SYNC_FLUSH) != Z_OK) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "gzip flush failed on " + path_);
  }
}

void GzipFileWriter::close() {
  if (!file_)
    return;
  int rc = gzclose(file_);
  file_ = nullptr;
  if (rc != Z_OK) {
    throw TransferError(TransferErrorKind::DESTINATION_UNAVAILABLE,
                        "gzip close failed on " + path_);
  }
}

std::unique_ptr<ByteWriter> openFileWriter(const std::string &path,
                                           bool gzip) {
  if (gzip)
    return std::make_unique<GzipFileWriter>(path);
  return std::make_unique<PlainFileWriter>(path);
}
