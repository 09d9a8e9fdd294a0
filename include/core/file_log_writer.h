#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

// Appends log lines to a file and rotates it once it grows past
// maxFileSize: doctransfer.log -> doctransfer.log.1 -> ... -> .maxBackupFiles.
class FileLogWriter : public ILogWriter {
private:
  std::ofstream file_;
  std::string fileName_;
  uintmax_t maxFileSize_;
  int maxBackupFiles_;
  uintmax_t currentSize_ = 0;
  mutable std::mutex mutex_;

public:
  FileLogWriter(const std::string &fileName,
                uintmax_t maxFileSize = 10 * 1024 * 1024,
                int maxBackupFiles = 5);
  ~FileLogWriter() override { close(); }

  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;
  void rotate();

  const std::string &fileName() const { return fileName_; }

private:
  void openFile();
  void rotateUnlocked();
};

#endif
