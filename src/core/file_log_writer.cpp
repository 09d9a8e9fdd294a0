#include "core/file_log_writer.h"
#include <filesystem>
#include <system_error>

// Opens (or creates) the log file in append mode. The parent directory is
// created on demand so a configured path like logs/doctransfer.log works on
// a fresh checkout. The current size is taken from the file system once;
// afterwards it is tracked from the bytes written so rotation does not stat
// the file on every line.
FileLogWriter::FileLogWriter(const std::string &fileName,
                             uintmax_t maxFileSize, int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles < 1 ? 1 : maxBackupFiles) {
  std::error_code ec;
  std::filesystem::path parent = std::filesystem::path(fileName_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  openFile();
}

void FileLogWriter::openFile() {
  file_.open(fileName_, std::ios::app);
  std::error_code ec;
  currentSize_ = std::filesystem::exists(fileName_, ec)
                     ? std::filesystem::file_size(fileName_, ec)
                     : 0;
  if (ec) {
    currentSize_ = 0;
  }
}

bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!file_.is_open())
    return false;

  if (currentSize_ + formattedMessage.size() + 1 > maxFileSize_ &&
      currentSize_ > 0) {
    rotateUnlocked();
    if (!file_.is_open())
      return false;
  }

  file_ << formattedMessage << '\n';
  currentSize_ += formattedMessage.size() + 1;
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

void FileLogWriter::rotate() {
  std::lock_guard<std::mutex> lock(mutex_);
  rotateUnlocked();
}

void FileLogWriter::rotateUnlocked() {
  if (file_.is_open()) {
    file_.close();
  }

  std::error_code ec;
  std::filesystem::remove(fileName_ + "." + std::to_string(maxBackupFiles_),
                          ec);
  for (int i = maxBackupFiles_ - 1; i > 0; --i) {
    std::string oldFile = fileName_ + "." + std::to_string(i);
    if (std::filesystem::exists(oldFile, ec)) {
      std::filesystem::rename(oldFile,
                              fileName_ + "." + std::to_string(i + 1), ec);
    }
  }

  if (std::filesystem::exists(fileName_, ec)) {
    std::filesystem::rename(fileName_, fileName_ + ".1", ec);
  }

  openFile();
}
