#ifndef BASE64_H
#define BASE64_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Base64 {

std::string encode(const std::vector<uint8_t> &data);

// Standard alphabet with '=' padding. Returns nullopt on any character
// outside the alphabet or a malformed tail.
std::optional<std::vector<uint8_t>> decode(std::string_view text);

} // namespace Base64

#endif
