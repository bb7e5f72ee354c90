#include "bfast/layout.hpp"
#include "bfast/alignment.hpp"
#include "bfast/strings.hpp"

#include <cstdint>
#include <string>

namespace bfast {

namespace {

std::string u(uint64_t v) { return std::to_string(v); }
std::string s(int64_t v) { return std::to_string(v); }

Result check_sizes(const std::vector<std::string>& names, const std::vector<int64_t>& sizes) {
  for (size_t i = 0; i < sizes.size(); ++i) {
    if (sizes[i] < 0)
      return fail(Error::NegativeSize, "buffer " + u(i) + " has negative size " + s(sizes[i]));
  }
  if (names.size() != sizes.size())
    return fail(Error::CountMismatch,
                "number of buffer names " + u(names.size()) +
                " is not equal to the number of buffer sizes " + u(sizes.size()));
  // NUL terminates entries in the name blob
  for (size_t i = 0; i < names.size(); ++i) {
    if (names[i].find('\0') != std::string::npos)
      return fail(Error::InvalidName, "buffer name " + u(i) + " contains a NUL byte");
  }
  return ok();
}

} // anonymous namespace

const char* error_name(Error e) {
  switch (e) {
    case Error::None:                return "None";
    case Error::MagicMismatch:       return "MagicMismatch";
    case Error::BoundsViolation:     return "BoundsViolation";
    case Error::RangeOverlap:        return "RangeOverlap";
    case Error::RangeOutOfBounds:    return "RangeOutOfBounds";
    case Error::MisalignedOffset:    return "MisalignedOffset";
    case Error::NameCountMismatch:   return "NameCountMismatch";
    case Error::NegativeSize:        return "NegativeSize";
    case Error::AlignmentDrift:      return "AlignmentDrift";
    case Error::CountMismatch:       return "CountMismatch";
    case Error::BufferSizeMismatch:  return "BufferSizeMismatch";
    case Error::ElementSizeMismatch: return "ElementSizeMismatch";
    case Error::CallbackFailed:      return "CallbackFailed";
    case Error::LimitExceeded:       return "LimitExceeded";
    case Error::InvalidName:         return "InvalidName";
    case Error::Io:                  return "Io";
    case Error::Internal:            return "Internal";
    default: return "Unknown";
  }
}

Result validate(const Preamble& p) {
  if (p.magic != MAGIC_SAME_ENDIAN && p.magic != MAGIC_SWAPPED_ENDIAN)
    return fail(Error::MagicMismatch, "invalid magic number " + u(p.magic));

  if (p.data_start < PREAMBLE_SIZE)
    return fail(Error::BoundsViolation,
                "data start " + u(p.data_start) + " cannot be before the preamble size " + u(PREAMBLE_SIZE));
  if (p.data_start > p.data_end)
    return fail(Error::BoundsViolation,
                "data start " + u(p.data_start) + " cannot be after the data end " + u(p.data_end));

  if (p.num_arrays < 0)
    return fail(Error::BoundsViolation, "number of arrays " + s(p.num_arrays) + " is negative");
  if (static_cast<uint64_t>(p.num_arrays) > p.data_end)
    return fail(Error::BoundsViolation,
                "number of arrays " + s(p.num_arrays) + " can't be more than the total size " + u(p.data_end));

  // ranges_end() must not wrap
  if (static_cast<uint64_t>(p.num_arrays) > (UINT64_MAX - PREAMBLE_SIZE) / RANGE_SIZE)
    return fail(Error::BoundsViolation, "number of arrays " + s(p.num_arrays) + " overflows the range table");
  if (p.ranges_end() > p.data_start)
    return fail(Error::BoundsViolation,
                "end of range table " + u(p.ranges_end()) + " can't be after data start " + u(p.data_start));

  return ok();
}

Result validate(const Header& h) {
  Result r = validate(h.preamble);
  if (!r) return r;

  const Preamble& p = h.preamble;
  if (h.ranges.size() != static_cast<uint64_t>(p.num_arrays))
    return fail(Error::BoundsViolation,
                "range table holds " + u(h.ranges.size()) + " entries but the preamble declares " + s(p.num_arrays));

  const uint64_t min = p.data_start;
  const uint64_t max = p.data_end;
  for (size_t i = 0; i < h.ranges.size(); ++i) {
    const Range& rg = h.ranges[i];
    if (!is_aligned(rg.begin))
      return fail(Error::MisalignedOffset, "range " + u(i) + " begin " + u(rg.begin) + " is not aligned");
    if (rg.begin < min || rg.begin > max)
      return fail(Error::RangeOutOfBounds,
                  "range " + u(i) + " begin " + u(rg.begin) + " is not in valid span of " + u(min) + " to " + u(max));
    if (i > 0 && rg.begin < h.ranges[i - 1].end)
      return fail(Error::RangeOverlap,
                  "range " + u(i) + " begin " + u(rg.begin) + " overlaps previous range ending at " + u(h.ranges[i - 1].end));
    if (rg.end < rg.begin || rg.end > max)
      return fail(Error::RangeOutOfBounds,
                  "range " + u(i) + " end " + u(rg.end) + " is not in valid span of " + u(rg.begin) + " to " + u(max));
  }

  if (h.names.size() + 1 != h.ranges.size())
    return fail(Error::NameCountMismatch,
                "number of buffer names " + u(h.names.size()) +
                " is not one less than the number of ranges " + u(h.ranges.size()));

  return ok();
}

Result make_header(const std::vector<std::string>& names,
                   const std::vector<int64_t>& sizes,
                   Header* out)
{
  Result r = check_sizes(names, sizes);
  if (!r) return r;

  Header h;
  h.names = names;
  h.preamble.magic = MAGIC;
  h.preamble.num_arrays = static_cast<int64_t>(sizes.size()) + 1;
  h.preamble.data_start = next_aligned(h.preamble.ranges_end());
  h.ranges.resize(static_cast<size_t>(h.preamble.num_arrays));

  // name blob first, then each payload, each starting aligned
  uint64_t cursor = h.preamble.data_start;
  for (size_t i = 0; i < h.ranges.size(); ++i) {
    const uint64_t size = (i == 0) ? packed_strings_size(names)
                                   : static_cast<uint64_t>(sizes[i - 1]);
    if (cursor > UINT64_MAX - (ALIGNMENT - 1) || size > UINT64_MAX - next_aligned(cursor))
      return fail(Error::LimitExceeded,
                  (i == 0 ? std::string("name blob") : "buffer " + u(i - 1)) + " of " + u(size) +
                  " bytes at offset " + u(cursor) + " overflows the 64-bit stream size");
    cursor = next_aligned(cursor);
    h.ranges[i].begin = cursor;
    cursor += size;
    h.ranges[i].end = cursor;
  }
  h.preamble.data_end = cursor;

  r = validate(h);
  if (!r) return fail(Error::Internal, "assembled header is inconsistent: " + r.error_message);

  *out = std::move(h);
  return ok();
}

Result compute_size(const std::vector<std::string>& names,
                    const std::vector<int64_t>& sizes,
                    uint64_t* out)
{
  Header h;
  Result r = make_header(names, sizes, &h);
  if (r) *out = h.preamble.data_end;
  return r;
}

} // namespace bfast
