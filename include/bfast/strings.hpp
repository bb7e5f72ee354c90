#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bfast {

// Name table: each name's UTF-8 bytes followed by a single 0 byte, in order.
std::vector<uint8_t> pack_strings(const std::vector<std::string>& names);

// Byte length of pack_strings(names) without building the blob.
uint64_t packed_strings_size(const std::vector<std::string>& names);

// Splits on 0 bytes. A trailing fragment without a terminator is still
// returned as the last name; an empty blob yields no names.
std::vector<std::string> unpack_strings(const uint8_t* bytes, size_t n);

inline std::vector<std::string> unpack_strings(const std::vector<uint8_t>& bytes) {
  return unpack_strings(bytes.data(), bytes.size());
}

} // namespace bfast
