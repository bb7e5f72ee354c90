#include "bfast/strings.hpp"

namespace bfast {

std::vector<uint8_t> pack_strings(const std::vector<std::string>& names) {
  std::vector<uint8_t> r;
  r.reserve(static_cast<size_t>(packed_strings_size(names)));
  for (const auto& name : names) {
    r.insert(r.end(), name.begin(), name.end());
    r.push_back(0);
  }
  return r;
}

uint64_t packed_strings_size(const std::vector<std::string>& names) {
  uint64_t n = 0;
  for (const auto& name : names) n += name.size() + 1;
  return n;
}

std::vector<std::string> unpack_strings(const uint8_t* bytes, size_t n) {
  std::vector<std::string> r;
  if (n == 0) return r;
  size_t prev = 0;
  for (size_t i = 0; i < n; ++i) {
    if (bytes[i] == 0) {
      r.emplace_back(reinterpret_cast<const char*>(bytes + prev), i - prev);
      prev = i + 1;
    }
  }
  if (prev < n)
    r.emplace_back(reinterpret_cast<const char*>(bytes + prev), n - prev);
  return r;
}

} // namespace bfast
