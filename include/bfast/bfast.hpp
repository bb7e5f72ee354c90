#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "bfast/alignment.hpp"
#include "bfast/framing.hpp"
#include "bfast/io.hpp"
#include "bfast/layout.hpp"
#include "bfast/result.hpp"
#include "bfast/strings.hpp"

namespace bfast {

/**
 * @brief Reader configuration
 */
struct Config {
    bool check_alignment = true;              // Verify aligned positions on sources that can report one
    bool accept_swapped = true;               // Accept streams written with the byte-swapped magic
    uint64_t max_buffer_bytes = 4ull << 30;   // Largest single range materialized into memory
};

/**
 * @brief A named payload held in memory
 */
struct NamedBuffer {
    std::string name;
    std::vector<uint8_t> bytes;
};

/**
 * @brief Named arrays of one element type, in stream order
 */
template <typename T>
using TypedBuffers = std::vector<std::pair<std::string, std::vector<T>>>;

/**
 * @brief Called once per buffer while writing; must write exactly @p size bytes to @p sink
 */
using EmitFn = std::function<Result(Sink& sink, size_t index, const std::string& name, int64_t size)>;

/**
 * @brief Called once per buffer while reading; must consume exactly @p count bytes from @p source
 */
using BufferFn = std::function<Result(Source& source, const std::string& name, uint64_t count)>;

// ---------------- writing ----------------

/**
 * @brief Write preamble, range table, name blob and the padding between them
 * @param sink Destination, positioned at the start of the stream
 * @param header Header produced by make_header()
 * @return Result; CountMismatch if ranges.size() != names.size() + 1
 */
Result write_header(Sink& sink, const Header& header);

/**
 * @brief Write every payload in order, each followed by zero padding
 * @param sink Destination, positioned just after write_header()
 * @param names Buffer names
 * @param sizes Byte size of each buffer
 * @param emit Producer invoked once per buffer
 * @return Result; NegativeSize, CountMismatch, BufferSizeMismatch, CallbackFailed, AlignmentDrift or Io
 */
Result write_body(Sink& sink,
                  const std::vector<std::string>& names,
                  const std::vector<int64_t>& sizes,
                  const EmitFn& emit);

/**
 * @brief Assemble a header, then write the complete stream
 */
Result write(Sink& sink,
             const std::vector<std::string>& names,
             const std::vector<int64_t>& sizes,
             const EmitFn& emit);

/**
 * @brief Write in-memory buffers as a complete stream
 */
Result write(Sink& sink, const std::vector<NamedBuffer>& buffers);

/**
 * @brief Write named arrays of trivially copyable @p T as a complete stream
 *
 * Elements are written in host byte order.
 */
template <typename T>
Result write(Sink& sink, const TypedBuffers<T>& buffers)
{
    static_assert(std::is_trivially_copyable<T>::value, "write needs a trivially copyable element type");
    std::vector<std::string> names;
    std::vector<int64_t> sizes;
    names.reserve(buffers.size());
    sizes.reserve(buffers.size());
    for (const auto& b : buffers) {
        names.push_back(b.first);
        sizes.push_back(static_cast<int64_t>(b.second.size() * sizeof(T)));
    }
    return write(sink, names, sizes,
        [&buffers](Sink& s, size_t index, const std::string& name, int64_t size) -> Result {
            const std::vector<T>& v = buffers[index].second;
            if (size > 0 && !s.write(reinterpret_cast<const uint8_t*>(v.data()), static_cast<size_t>(size)))
                return fail(Error::Io, "short write in buffer '" + name + "'");
            return ok();
        });
}

// ---------------- reading ----------------

/**
 * @brief Parse and validate the header, leaving @p source at the first payload
 * @param source Origin, positioned at the start of the stream
 * @param out Receives the validated header (fields already in host order)
 * @param config Reader configuration
 */
Result read_header(Source& source, Header* out, const Config& config = Config());

/**
 * @brief Read the header, then hand every payload to @p on_buffer in index order
 * @param source Origin, positioned at the start of the stream
 * @param on_buffer Consumer invoked once per buffer
 * @param header_out Optional; receives the parsed header
 * @param config Reader configuration
 */
Result read_each(Source& source, const BufferFn& on_buffer,
                 Header* header_out = nullptr, const Config& config = Config());

/**
 * @brief Read every buffer as a value produced by @p on_buffer
 * @tparam T Caller-chosen representation of one buffer
 * @param on_buffer Callable `Result(Source&, const std::string& name, uint64_t count, T* out)`
 * @param out Receives (name, value) pairs in stream order; untouched on failure
 */
template <typename T, typename F>
Result read(Source& source, F on_buffer,
            std::vector<std::pair<std::string, T>>* out,
            const Config& config = Config())
{
    std::vector<std::pair<std::string, T>> r;
    Result res = read_each(source,
        [&](Source& s, const std::string& name, uint64_t count) -> Result {
            T value{};
            Result cb = on_buffer(s, name, count, &value);
            if (cb) r.emplace_back(name, std::move(value));
            return cb;
        },
        nullptr, config);
    if (res) *out = std::move(r);
    return res;
}

/**
 * @brief Read every buffer as raw bytes
 */
Result read_buffers(Source& source, std::vector<NamedBuffer>* out, const Config& config = Config());

/**
 * @brief Read every buffer as an array of trivially copyable @p T
 *
 * Elements are copied out of the stream bytes as-is; payloads written on a
 * host of the other byte order are not converted.
 */
template <typename T>
Result read_typed(Source& source,
                  TypedBuffers<T>* out,
                  const Config& config = Config())
{
    static_assert(std::is_trivially_copyable<T>::value, "read_typed needs a trivially copyable element type");
    return read<std::vector<T>>(source,
        [&config](Source& s, const std::string& name, uint64_t count, std::vector<T>* v) -> Result {
            if (count % sizeof(T) != 0)
                return fail(Error::ElementSizeMismatch,
                            "buffer '" + name + "' holds " + std::to_string(count) +
                            " bytes, not a multiple of element size " + std::to_string(sizeof(T)));
            if (count > config.max_buffer_bytes)
                return fail(Error::LimitExceeded,
                            "buffer '" + name + "' of " + std::to_string(count) + " bytes exceeds limit");
            v->resize(static_cast<size_t>(count / sizeof(T)));
            if (count > 0 && !s.read(reinterpret_cast<uint8_t*>(v->data()), static_cast<size_t>(count)))
                return fail(Error::Io, "short read in buffer '" + name + "'");
            return ok();
        },
        out, config);
}

// ---------------- in-memory ----------------

/**
 * @brief Serialize buffers described by names/sizes and produced by @p emit into @p out
 */
Result pack(const std::vector<std::string>& names,
            const std::vector<int64_t>& sizes,
            const EmitFn& emit,
            std::vector<uint8_t>* out);

/**
 * @brief Serialize in-memory buffers into @p out
 */
Result pack(const std::vector<NamedBuffer>& buffers, std::vector<uint8_t>* out);

/**
 * @brief Serialize named arrays of trivially copyable @p T into @p out
 */
template <typename T>
Result pack(const TypedBuffers<T>& buffers, std::vector<uint8_t>* out)
{
    std::vector<uint8_t> bytes;
    MemorySink sink(bytes);
    Result r = write(sink, buffers);
    if (r) *out = std::move(bytes);
    return r;
}

/**
 * @brief Parse a complete stream held in memory
 */
Result unpack(const uint8_t* data, size_t size, std::vector<NamedBuffer>* out,
              const Config& config = Config());

inline Result unpack(const std::vector<uint8_t>& data, std::vector<NamedBuffer>* out,
                     const Config& config = Config()) {
    return unpack(data.data(), data.size(), out, config);
}

// ---------------- files ----------------

/**
 * @brief Write buffers produced by @p emit to @p path, replacing any existing file
 */
Result write_file(const std::string& path,
                  const std::vector<std::string>& names,
                  const std::vector<int64_t>& sizes,
                  const EmitFn& emit);

/**
 * @brief Write buffers to @p path, replacing any existing file
 */
Result write_file(const std::string& path, const std::vector<NamedBuffer>& buffers);

/**
 * @brief Read all buffers from the file at @p path
 */
Result read_file(const std::string& path, std::vector<NamedBuffer>* out,
                 const Config& config = Config());

/**
 * @brief Get version information
 */
std::string get_version();

} // namespace bfast
