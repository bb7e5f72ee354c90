#pragma once
#include <cstdint>

namespace bfast {

// Every buffer and region boundary in a BFAST stream starts on a multiple of this.
static constexpr uint64_t ALIGNMENT = 32;

inline constexpr bool is_aligned(uint64_t n) { return n % ALIGNMENT == 0; }

inline constexpr uint64_t next_aligned(uint64_t n) {
  return is_aligned(n) ? n : n + ALIGNMENT - (n % ALIGNMENT);
}

// Zero bytes needed after offset n to reach the next aligned offset (0..31).
inline constexpr uint64_t padding(uint64_t n) { return next_aligned(n) - n; }

} // namespace bfast
