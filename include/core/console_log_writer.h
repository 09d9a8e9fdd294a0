#ifndef CONSOLE_LOG_WRITER_H
#define CONSOLE_LOG_WRITER_H

#include "core/log_writer.h"
#include <atomic>
#include <mutex>

// Writes formatted log lines to stderr. stdout stays free for tool output.
class ConsoleLogWriter : public ILogWriter {
private:
  std::mutex mutex_;
  std::atomic<bool> open_{true};

public:
  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override { return open_; }
};

#endif
