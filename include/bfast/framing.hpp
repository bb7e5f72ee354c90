#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace bfast {

// BFAST stream framing
// [Preamble][Range x num_arrays][pad][name blob][pad], then repeated [payload][pad].
// All header words are u64 little-endian; every region begins 32-byte aligned.

static constexpr uint64_t MAGIC_SAME_ENDIAN    = 0x000000000000BFA5ull; // A5 BF 00 00 00 00 00 00
static constexpr uint64_t MAGIC_SWAPPED_ENDIAN = 0xA5BF000000000000ull; // written by a big-endian host
static constexpr uint64_t MAGIC = MAGIC_SAME_ENDIAN;

static constexpr uint64_t PREAMBLE_SIZE = 32;
static constexpr uint64_t RANGE_SIZE    = 16;

struct Preamble {
  uint64_t magic      = MAGIC;
  uint64_t data_start = 0;   // first byte of the name blob (aligned)
  uint64_t data_end   = 0;   // one past the last payload byte
  int64_t  num_arrays = 0;   // payload buffers + 1 for the name blob

  // Offset just past the range table; derived, never stored.
  uint64_t ranges_end() const {
    return PREAMBLE_SIZE + static_cast<uint64_t>(num_arrays) * RANGE_SIZE;
  }
};

struct Range {
  uint64_t begin = 0;
  uint64_t end   = 0;

  uint64_t count() const { return end - begin; }
};

// ranges[0] is always the name blob; ranges[i+1] belongs to names[i].
struct Header {
  Preamble                 preamble;
  std::vector<Range>       ranges;
  std::vector<std::string> names;
};

inline bool operator==(const Range& a, const Range& b) {
  return a.begin == b.begin && a.end == b.end;
}
inline bool operator!=(const Range& a, const Range& b) { return !(a == b); }

// ----- byte order -----
inline uint64_t swap_endian(uint64_t v) {
  uint64_t r = 0;
  for (int i = 0; i < 8; ++i) {
    r = (r << 8) | (v & 0xFF);
    v >>= 8;
  }
  return r;
}

inline void encode_u64_le(uint64_t v, uint8_t b[8]) {
  for (int i = 0; i < 8; ++i) b[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
}

inline uint64_t decode_u64_le(const uint8_t b[8]) {
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) v = (v << 8) | static_cast<uint64_t>(b[i]);
  return v;
}

// Fixed 32-byte wire form of a Preamble: magic, data_start, data_end, num_arrays.
inline void encode_preamble(const Preamble& p, uint8_t out[PREAMBLE_SIZE]) {
  encode_u64_le(p.magic,      out + 0);
  encode_u64_le(p.data_start, out + 8);
  encode_u64_le(p.data_end,   out + 16);
  encode_u64_le(static_cast<uint64_t>(p.num_arrays), out + 24);
}

inline Preamble decode_preamble(const uint8_t in[PREAMBLE_SIZE]) {
  Preamble p;
  p.magic      = decode_u64_le(in + 0);
  p.data_start = decode_u64_le(in + 8);
  p.data_end   = decode_u64_le(in + 16);
  p.num_arrays = static_cast<int64_t>(decode_u64_le(in + 24));
  return p;
}

// Converts every numeric field of a preamble read from a swapped-magic stream.
inline Preamble swap_preamble(const Preamble& p) {
  Preamble r;
  r.magic      = swap_endian(p.magic);
  r.data_start = swap_endian(p.data_start);
  r.data_end   = swap_endian(p.data_end);
  r.num_arrays = static_cast<int64_t>(swap_endian(static_cast<uint64_t>(p.num_arrays)));
  return r;
}

} // namespace bfast
