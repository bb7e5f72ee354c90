#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <string>
#include <sys/stat.h>

#include "bfast/io.hpp"

namespace bfast {

// ----- error + abort -----
inline void die(const char* msg) {
  std::fprintf(stderr, "%s\n", msg);
  std::quick_exit(2);
}

inline void die(const std::string& msg) { die(msg.c_str()); }

// ----- file helpers -----
// Size of a regular file, or -1 if it cannot be stat'ed.
inline int64_t file_size(const std::string& path) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) return -1;
  if (!S_ISREG(st.st_mode)) return -1;
  return static_cast<int64_t>(st.st_size);
}

// Last path component, used as the default buffer name.
inline std::string base_name(const std::string& path) {
  size_t slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

// Copies exactly n bytes from f to the sink in fixed-size chunks.
inline bool copy_exact(FILE* f, Sink& sink, uint64_t n) {
  uint8_t buf[64 * 1024];
  while (n > 0) {
    size_t want = n < sizeof(buf) ? static_cast<size_t>(n) : sizeof(buf);
    size_t got = std::fread(buf, 1, want, f);
    if (got == 0) return false; // EOF or short read
    if (!sink.write(buf, got)) return false;
    n -= got;
  }
  return true;
}

// Copies exactly n bytes from the source to f in fixed-size chunks.
inline bool copy_exact(Source& src, FILE* f, uint64_t n) {
  uint8_t buf[64 * 1024];
  while (n > 0) {
    size_t want = n < sizeof(buf) ? static_cast<size_t>(n) : sizeof(buf);
    if (!src.read(buf, want)) return false;
    if (std::fwrite(buf, 1, want, f) != want) return false;
    n -= want;
  }
  return true;
}

} // namespace bfast
