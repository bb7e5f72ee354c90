#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "bfast/framing.hpp"
#include "bfast/result.hpp"

namespace bfast {

// Computes a validated Header for buffers of the given names and byte sizes.
// Slot 0 is reserved for the packed name blob; every range begins aligned.
Result make_header(const std::vector<std::string>& names,
                   const std::vector<int64_t>& sizes,
                   Header* out);

// Total stream size (data_end) for the given buffers, without writing.
Result compute_size(const std::vector<std::string>& names,
                    const std::vector<int64_t>& sizes,
                    uint64_t* out);

// Structural checks, in order: magic, bounds, counts, ranges, names.
Result validate(const Preamble& p);
Result validate(const Header& h);

} // namespace bfast
