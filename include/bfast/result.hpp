#pragma once
#include <string>
#include <utility>

namespace bfast {

/**
 * @brief Failure kinds reported by the codec
 */
enum class Error {
    None = 0,
    MagicMismatch,        // magic is neither the native nor the swapped sentinel
    BoundsViolation,      // data_start / data_end / num_arrays inconsistent
    RangeOverlap,         // a range begins before the previous one ends
    RangeOutOfBounds,     // a range lies outside [data_start, data_end]
    MisalignedOffset,     // a range begins off a 32-byte boundary
    NameCountMismatch,    // names.size() != ranges.size() - 1
    NegativeSize,         // a declared buffer size is < 0
    AlignmentDrift,       // observed stream position not aligned where it must be
    CountMismatch,        // caller passed different numbers of names and sizes
    BufferSizeMismatch,   // a write callback produced the wrong number of bytes
    ElementSizeMismatch,  // typed read: element size does not divide the byte count
    CallbackFailed,       // a caller-supplied emit/on_buffer function failed
    LimitExceeded,        // a range exceeds Config::max_buffer_bytes, or offsets exceed 64 bits
    InvalidName,          // a buffer name contains a NUL byte
    Io,                   // short read, short write, or open failure
    Internal              // assembled header failed validation
};

/**
 * @brief Outcome of a codec operation; first violated invariant wins
 */
struct Result {
    bool success = true;
    Error error = Error::None;
    std::string error_message;

    explicit operator bool() const { return success; }
};

inline Result ok() { return Result{}; }

inline Result fail(Error e, std::string msg) {
    Result r;
    r.success = false;
    r.error = e;
    r.error_message = std::move(msg);
    return r;
}

const char* error_name(Error e);

} // namespace bfast
