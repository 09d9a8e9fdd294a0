#include "utils/base64.h"

namespace Base64 {

namespace {
const char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decodeChar(char c) {
  if (c >= 'A' && c <= 'Z')
    return c - 'A';
  if (c >= 'a' && c <= 'z')
    return c - 'a' + 26;
  if (c >= '0' && c <= '9')
    return c - '0' + 52;
  if (c == '+')
    return 62;
  if (c == '/')
    return 63;
  return -1;
}
} // namespace

std::string encode(const std::vector<uint8_t> &data) {
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
    out.push_back(ALPHABET[(n >> 18) & 0x3f]);
    out.push_back(ALPHABET[(n >> 12) & 0x3f]);
    out.push_back(ALPHABET[(n >> 6) & 0x3f]);
    out.push_back(ALPHABET[n & 0x3f]);
  }

  size_t rest = data.size() - i;
  if (rest == 1) {
    uint32_t n = data[i] << 16;
    out.push_back(ALPHABET[(n >> 18) & 0x3f]);
    out.push_back(ALPHABET[(n >> 12) & 0x3f]);
    out += "==";
  } else if (rest == 2) {
    uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
    out.push_back(ALPHABET[(n >> 18) & 0x3f]);
    out.push_back(ALPHABET[(n >> 12) & 0x3f]);
    out.push_back(ALPHABET[(n >> 6) & 0x3f]);
    out.push_back('=');
  }
  return out;
}

std::optional<std::vector<uint8_t>> decode(std::string_view text) {
  if (text.size() % 4 != 0)
    return std::nullopt;

  std::vector<uint8_t> out;
  out.reserve(text.size() / 4 * 3);

  for (size_t i = 0; i < text.size(); i += 4) {
    bool last = i + 4 == text.size();
    int padding = 0;
    uint32_t n = 0;
    for (size_t j = 0; j < 4; ++j) {
      char c = text[i + j];
      if (c == '=') {
        if (!last || j < 2)
          return std::nullopt;
        ++padding;
        n <<= 6;
        continue;
      }
      if (padding > 0)
        return std::nullopt;
      int v = decodeChar(c);
      if (v < 0)
        return std::nullopt;
      n = (n << 6) | static_cast<uint32_t>(v);
    }
    out.push_back(static_cast<uint8_t>((n >> 16) & 0xff));
    if (padding < 2)
      out.push_back(static_cast<uint8_t>((n >> 8) & 0xff));
    if (padding < 1)
      out.push_back(static_cast<uint8_t>(n & 0xff));
  }
  return out;
}

} // namespace Base64
