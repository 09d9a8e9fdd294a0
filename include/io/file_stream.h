#ifndef FILE_STREAM_H
#define FILE_STREAM_H

#include "io/byte_stream.h"
#include <fstream>
#include <memory>
#include <string>
#include <zlib.h>

// Reads plain or gzip-compressed files. zlib's gzread passes uncompressed
// input through unchanged, so one reader covers both.
class GzipFileReader : public ByteReader {
public:
  explicit GzipFileReader(const std::string &path);
  ~GzipFileReader() override;

  GzipFileReader(const GzipFileReader &) = delete;
  GzipFileReader &operator=(const GzipFileReader &) = delete;

  size_t read(char *buffer, size_t len) override;
  std::string name() const override { return path_; }

private:
  std::string path_;
  gzFile file_ = nullptr;
};

class PlainFileWriter : public ByteWriter {
public:
  explicit PlainFileWriter(const std::string &path);
  ~PlainFileWriter() override;

  void write(std::string_view data) override;
  void flush() override;
  void close() override;
  std::string name() const override { return path_; }

private:
  std::string path_;
  std::ofstream file_;
};

class GzipFileWriter : public ByteWriter {
public:
  explicit GzipFileWriter(const std::string &path, int level = 6);
  ~GzipFileWriter() override;

  GzipFileWriter(const GzipFileWriter &) = delete;
  GzipFileWriter &operator=(const GzipFileWriter &) = delete;

  void write(std::string_view data) override;
  void flush() override;
  void close() override;
  std::string name() const override { return path_; }

private:
  std::string path_;
  gzFile file_ = nullptr;
};

std::unique_ptr<ByteWriter> openFileWriter(const std::string &path, bool gzip);

#endif
