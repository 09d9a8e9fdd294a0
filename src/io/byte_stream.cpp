#include "io/byte_stream.h"
#include <algorithm>
#include <cstring>

size_t StringByteReader::read(char *buffer, size_t len) {
  size_t n = std::min(len, data_.size() - pos_);
  if (n > 0) {
    std::memcpy(buffer, data_.data() + pos_, n);
    pos_ += n;
  }
  return n;
}

TextInput::TextInput(ByteReader &reader, size_t bufferSize)
    : reader_(reader), buffer_(bufferSize > 0 ? bufferSize : 4096),
      name_(reader.name()) {}

bool TextInput::fill() {
  if (pos_ < end_)
    return true;
  if (eof_)
    return false;
  end_ = reader_.read(buffer_.data(), buffer_.size());
  pos_ = 0;
  if (end_ == 0) {
    eof_ = true;
    return false;
  }
  return true;
}

int TextInput::get() {
  if (!fill())
    return -1;
  char c = buffer_[pos_++];
  if (c == '\n')
    ++line_;
  return static_cast<unsigned char>(c);
}

int TextInput::peek() {
  if (!fill())
    return -1;
  return static_cast<unsigned char>(buffer_[pos_]);
}

bool TextInput::readLine(std::string &line) {
  line.clear();
  if (!fill())
    return false;

  while (fill()) {
    const char *start = buffer_.data() + pos_;
    const char *stop = buffer_.data() + end_;
    const char *nl = static_cast<const char *>(
        std::memchr(start, '\n', static_cast<size_t>(stop - start)));
    if (nl) {
      line.append(start, nl);
      pos_ += static_cast<size_t>(nl - start) + 1;
      ++line_;
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      return true;
    }
    line.append(start, stop);
    pos_ = end_;
  }
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return true;
}
