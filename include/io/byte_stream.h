#ifndef BYTE_STREAM_H
#define BYTE_STREAM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

class ByteReader {
public:
  virtual ~ByteReader() = default;

  // Reads up to len bytes; returns 0 at end of input. Throws TransferError
  // on I/O failure.
  virtual size_t read(char *buffer, size_t len) = 0;
  virtual std::string name() const = 0;
};

class ByteWriter {
public:
  virtual ~ByteWriter() = default;

  virtual void write(std::string_view data) = 0;
  virtual void flush() = 0;
  // Flushes and releases the underlying resource. Further writes fail.
  virtual void close() = 0;
  virtual std::string name() const = 0;
};

class StringByteReader : public ByteReader {
public:
  explicit StringByteReader(std::string data, std::string name = "memory")
      : data_(std::move(data)), name_(std::move(name)) {}

  size_t read(char *buffer, size_t len) override;
  std::string name() const override { return name_; }

private:
  std::string data_;
  size_t pos_ = 0;
  std::string name_;
};

// Collects everything written into a string. The buffer can be shared so the
// caller can look at it after the sink that owns the writer is gone.
class StringByteWriter : public ByteWriter {
public:
  explicit StringByteWriter(std::shared_ptr<std::string> target =
                                std::make_shared<std::string>())
      : target_(std::move(target)) {}

  void write(std::string_view data) override { target_->append(data); }
  void flush() override {}
  void close() override {}
  std::string name() const override { return "memory"; }

  const std::string &str() const { return *target_; }
  std::shared_ptr<std::string> buffer() const { return target_; }

private:
  std::shared_ptr<std::string> target_;
};

// Buffered character access over a ByteReader with 1-based line tracking.
class TextInput {
public:
  explicit TextInput(ByteReader &reader, size_t bufferSize = 64 * 1024);

  // Returns the next byte or -1 at end of input.
  int get();
  int peek();
  // Reads one line without its terminator (\n or \r\n). Returns false at end
  // of input when nothing was read.
  bool readLine(std::string &line);

  // Line number of the next character to be read.
  uint64_t line() const { return line_; }
  const std::string &sourceName() const { return name_; }

private:
  bool fill();

  ByteReader &reader_;
  std::vector<char> buffer_;
  size_t pos_ = 0;
  size_t end_ = 0;
  bool eof_ = false;
  uint64_t line_ = 1;
  std::string name_;
};

#endif
