#include "bfast/io.hpp"
#include "bfast/framing.hpp"

#include <algorithm>
#include <cstring>

namespace bfast {

bool Source::skip(uint64_t n) {
  uint8_t scratch[256];
  while (n > 0) {
    const size_t k = static_cast<size_t>(std::min<uint64_t>(n, sizeof(scratch)));
    if (!read(scratch, k)) return false;
    n -= k;
  }
  return true;
}

bool FileSink::write(const uint8_t* p, size_t n) {
  if (n == 0) return true;
  size_t w = std::fwrite(p, 1, n, f_);
  written_ += w;
  return w == n;
}

FileSource::FileSource(FILE* f) : f_(f) {
  start_ = std::ftell(f_);
  seekable_ = start_ >= 0;
  if (!seekable_) std::clearerr(f_);
}

bool FileSource::read(uint8_t* dst, size_t n) {
  size_t total = 0;
  while (total < n) {
    size_t got = std::fread(dst + total, 1, n - total, f_);
    if (got == 0) return false; // EOF or error
    total += got;
  }
  return true;
}

bool FileSource::tell(uint64_t* pos) const {
  if (!seekable_) return false;
  long cur = std::ftell(f_);
  if (cur < start_) return false;
  *pos = static_cast<uint64_t>(cur - start_);
  return true;
}

bool MemorySource::read(uint8_t* dst, size_t n) {
  if (n > remaining()) return false;
  if (n > 0) std::memcpy(dst, data_ + pos_, n);
  pos_ += n;
  return true;
}

bool MemorySource::skip(uint64_t n) {
  if (n > remaining()) return false;
  pos_ += static_cast<size_t>(n);
  return true;
}

bool write_zero_bytes(Sink& s, uint64_t n) {
  static const uint8_t zeros[64] = {};
  while (n > 0) {
    const size_t k = static_cast<size_t>(std::min<uint64_t>(n, sizeof(zeros)));
    if (!s.write(zeros, k)) return false;
    n -= k;
  }
  return true;
}

bool write_u64_le(Sink& s, uint64_t v) {
  uint8_t b[8];
  encode_u64_le(v, b);
  return s.write(b, sizeof(b));
}

bool read_u64_le(Source& src, uint64_t* v) {
  uint8_t b[8];
  if (!src.read(b, sizeof(b))) return false;
  *v = decode_u64_le(b);
  return true;
}

} // namespace bfast
