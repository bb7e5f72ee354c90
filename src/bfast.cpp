#include "bfast/bfast.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace bfast {

namespace {

std::string u(uint64_t v) { return std::to_string(v); }

// Fails with AlignmentDrift if the source reports an unaligned position.
Result check_alignment(const Source& src, const Config& config, const char* where) {
    if (!config.check_alignment) return ok();
    uint64_t pos = 0;
    if (!src.tell(&pos)) return ok(); // non-seekable: trust the declared sizes
    if (!is_aligned(pos))
        return fail(Error::AlignmentDrift, std::string("stream position ") + u(pos) +
                    " is not aligned " + where);
    return ok();
}

Result check_alignment(const Sink& sink, const char* where) {
    if (!is_aligned(sink.position()))
        return fail(Error::AlignmentDrift, std::string("sink position ") + u(sink.position()) +
                    " is not aligned " + where);
    return ok();
}

// Advances from logical offset *at to target, consuming the gap.
Result skip_to(Source& src, uint64_t* at, uint64_t target) {
    if (target < *at)
        return fail(Error::RangeOverlap, "offset " + u(target) + " lies before stream position " + u(*at));
    if (!src.skip(target - *at))
        return fail(Error::Io, "unexpected end of stream while skipping to offset " + u(target));
    *at = target;
    return ok();
}

struct FileCloser {
    void operator()(FILE* f) const { if (f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

} // anonymous namespace

// ---------------- writing ----------------

Result write_header(Sink& sink, const Header& header) {
    if (header.ranges.size() != header.names.size() + 1)
        return fail(Error::CountMismatch,
                    "number of ranges " + u(header.ranges.size()) +
                    " must be one more than the number of names " + u(header.names.size()));
    if (header.preamble.num_arrays < 0 ||
        static_cast<uint64_t>(header.preamble.num_arrays) != header.ranges.size())
        return fail(Error::CountMismatch,
                    "preamble declares " + std::to_string(header.preamble.num_arrays) +
                    " arrays but the header holds " + u(header.ranges.size()) + " ranges");

    const std::vector<uint8_t> blob = pack_strings(header.names);
    const Range& names_range = header.ranges[0];
    if (blob.size() != names_range.count())
        return fail(Error::BufferSizeMismatch,
                    "name blob is " + u(blob.size()) + " bytes but range 0 declares " + u(names_range.count()));

    uint8_t pre[PREAMBLE_SIZE];
    encode_preamble(header.preamble, pre);
    if (!sink.write(pre, sizeof(pre)))
        return fail(Error::Io, "short write in preamble");
    for (const Range& r : header.ranges) {
        if (!write_u64_le(sink, r.begin) || !write_u64_le(sink, r.end))
            return fail(Error::Io, "short write in range table");
    }

    if (names_range.begin < sink.position())
        return fail(Error::RangeOverlap,
                    "name blob offset " + u(names_range.begin) + " overlaps the range table");
    if (!write_zero_bytes(sink, names_range.begin - sink.position()))
        return fail(Error::Io, "short write in range table padding");

    Result r = check_alignment(sink, "at the name blob");
    if (!r) return r;

    if (!blob.empty() && !sink.write(blob.data(), blob.size()))
        return fail(Error::Io, "short write in name blob");
    if (!write_zero_bytes(sink, padding(names_range.end)))
        return fail(Error::Io, "short write in name blob padding");

    return check_alignment(sink, "after the header");
}

Result write_body(Sink& sink,
                  const std::vector<std::string>& names,
                  const std::vector<int64_t>& sizes,
                  const EmitFn& emit)
{
    for (size_t i = 0; i < sizes.size(); ++i) {
        if (sizes[i] < 0)
            return fail(Error::NegativeSize, "buffer " + u(i) + " has negative size " + std::to_string(sizes[i]));
    }
    if (names.size() != sizes.size())
        return fail(Error::CountMismatch,
                    "number of buffer names " + u(names.size()) +
                    " is not equal to the number of buffer sizes " + u(sizes.size()));

    for (size_t i = 0; i < names.size(); ++i) {
        Result r = check_alignment(sink, "before a buffer");
        if (!r) return r;

        const uint64_t n = static_cast<uint64_t>(sizes[i]);
        const uint64_t before = sink.position();
        try {
            r = emit(sink, i, names[i], sizes[i]);
        } catch (const std::exception& e) {
            return fail(Error::CallbackFailed, "writing buffer '" + names[i] + "' failed: " + e.what());
        }
        if (!r) {
            if (r.error == Error::None) r.error = Error::CallbackFailed;
            r.success = false;
            return r;
        }

        const uint64_t wrote = sink.position() - before;
        if (wrote != n)
            return fail(Error::BufferSizeMismatch,
                        "buffer '" + names[i] + "' declared " + u(n) + " bytes but " + u(wrote) + " were written");

        if (!write_zero_bytes(sink, padding(n)))
            return fail(Error::Io, "short write in padding after buffer '" + names[i] + "'");
    }
    return check_alignment(sink, "at the end of the stream");
}

Result write(Sink& sink,
             const std::vector<std::string>& names,
             const std::vector<int64_t>& sizes,
             const EmitFn& emit)
{
    Header header;
    Result r = make_header(names, sizes, &header);
    if (!r) return r;
    r = write_header(sink, header);
    if (!r) return r;
    return write_body(sink, names, sizes, emit);
}

Result write(Sink& sink, const std::vector<NamedBuffer>& buffers) {
    std::vector<std::string> names;
    std::vector<int64_t> sizes;
    names.reserve(buffers.size());
    sizes.reserve(buffers.size());
    for (const auto& b : buffers) {
        names.push_back(b.name);
        sizes.push_back(static_cast<int64_t>(b.bytes.size()));
    }
    return write(sink, names, sizes,
        [&buffers](Sink& s, size_t index, const std::string& name, int64_t) -> Result {
            const auto& bytes = buffers[index].bytes;
            if (!bytes.empty() && !s.write(bytes.data(), bytes.size()))
                return fail(Error::Io, "short write in buffer '" + name + "'");
            return ok();
        });
}

// ---------------- reading ----------------

Result read_header(Source& source, Header* out, const Config& config) {
    Header h;

    uint8_t pre[PREAMBLE_SIZE];
    if (!source.read(pre, sizeof(pre)))
        return fail(Error::Io, "unexpected end of stream in preamble");
    h.preamble = decode_preamble(pre);

    const bool swapped = h.preamble.magic == MAGIC_SWAPPED_ENDIAN;
    if (swapped) {
        if (!config.accept_swapped)
            return fail(Error::MagicMismatch, "byte-swapped magic number rejected by configuration");
        h.preamble = swap_preamble(h.preamble);
    }

    Result r = validate(h.preamble);
    if (!r) return r;

    // Grow as entries arrive so a lying num_arrays hits EOF, not a huge allocation.
    for (int64_t i = 0; i < h.preamble.num_arrays; ++i) {
        Range rg;
        if (!read_u64_le(source, &rg.begin) || !read_u64_le(source, &rg.end))
            return fail(Error::Io, "unexpected end of stream in range table at entry " + u(static_cast<uint64_t>(i)));
        if (swapped) {
            rg.begin = swap_endian(rg.begin);
            rg.end = swap_endian(rg.end);
        }
        h.ranges.push_back(rg);
    }
    uint64_t at = h.preamble.ranges_end();

    if (h.ranges.empty())
        return fail(Error::NameCountMismatch, "stream has no name blob range");

    const Range names_range = h.ranges[0];
    // The blob is read before full validation; bound it to the data region first.
    if (!is_aligned(names_range.begin))
        return fail(Error::MisalignedOffset, "range 0 begin " + u(names_range.begin) + " is not aligned");
    if (names_range.begin < h.preamble.data_start || names_range.end < names_range.begin ||
        names_range.end > h.preamble.data_end)
        return fail(Error::RangeOutOfBounds,
                    "name blob range " + u(names_range.begin) + ".." + u(names_range.end) +
                    " is not in valid span of " + u(h.preamble.data_start) + " to " + u(h.preamble.data_end));
    if (names_range.count() > config.max_buffer_bytes)
        return fail(Error::LimitExceeded, "name blob of " + u(names_range.count()) + " bytes exceeds limit");

    r = skip_to(source, &at, names_range.begin);
    if (!r) return r;
    r = check_alignment(source, config, "at the name blob");
    if (!r) return r;

    std::vector<uint8_t> blob(static_cast<size_t>(names_range.count()));
    if (!blob.empty() && !source.read(blob.data(), blob.size()))
        return fail(Error::Io, "unexpected end of stream in name blob");
    at += names_range.count();
    h.names = unpack_strings(blob);

    r = skip_to(source, &at, next_aligned(at));
    if (!r) return r;
    r = check_alignment(source, config, "after the name blob");
    if (!r) return r;

    r = validate(h);
    if (!r) return r;

    *out = std::move(h);
    return ok();
}

Result read_each(Source& source, const BufferFn& on_buffer,
                 Header* header_out, const Config& config)
{
    Header h;
    Result r = read_header(source, &h, config);
    if (!r) return r;

    uint64_t at = next_aligned(h.ranges[0].end);
    for (size_t i = 1; i < h.ranges.size(); ++i) {
        const Range& rg = h.ranges[i];
        const std::string& name = h.names[i - 1];

        r = skip_to(source, &at, rg.begin);
        if (!r) return r;
        r = check_alignment(source, config, "before a buffer");
        if (!r) return r;

        uint64_t before = 0;
        const bool can_tell = source.tell(&before);
        try {
            r = on_buffer(source, name, rg.count());
        } catch (const std::exception& e) {
            return fail(Error::CallbackFailed, "reading buffer '" + name + "' failed: " + e.what());
        }
        if (!r) {
            if (r.error == Error::None) r.error = Error::CallbackFailed;
            r.success = false;
            return r;
        }

        uint64_t after = 0;
        if (can_tell && source.tell(&after) && after - before != rg.count())
            return fail(Error::BufferSizeMismatch,
                        "buffer '" + name + "' holds " + u(rg.count()) + " bytes but " +
                        u(after - before) + " were consumed");
        at = rg.end;

        r = skip_to(source, &at, next_aligned(at));
        if (!r) return r;
        r = check_alignment(source, config, "after a buffer");
        if (!r) return r;
    }

    if (header_out) *header_out = std::move(h);
    return ok();
}

Result read_buffers(Source& source, std::vector<NamedBuffer>* out, const Config& config) {
    std::vector<NamedBuffer> r;
    Result res = read_each(source,
        [&](Source& s, const std::string& name, uint64_t count) -> Result {
            if (count > config.max_buffer_bytes)
                return fail(Error::LimitExceeded,
                            "buffer '" + name + "' of " + u(count) + " bytes exceeds limit " + u(config.max_buffer_bytes));
            NamedBuffer b;
            b.name = name;
            b.bytes.resize(static_cast<size_t>(count));
            if (count > 0 && !s.read(b.bytes.data(), b.bytes.size()))
                return fail(Error::Io, "unexpected end of stream in buffer '" + name + "'");
            r.push_back(std::move(b));
            return ok();
        },
        nullptr, config);
    if (res) *out = std::move(r);
    return res;
}

// ---------------- in-memory ----------------

Result pack(const std::vector<std::string>& names,
            const std::vector<int64_t>& sizes,
            const EmitFn& emit,
            std::vector<uint8_t>* out)
{
    std::vector<uint8_t> bytes;
    uint64_t total = 0;
    if (compute_size(names, sizes, &total))
        bytes.reserve(static_cast<size_t>(next_aligned(total)));
    MemorySink sink(bytes);
    Result r = write(sink, names, sizes, emit);
    if (r) *out = std::move(bytes);
    return r;
}

Result pack(const std::vector<NamedBuffer>& buffers, std::vector<uint8_t>* out) {
    std::vector<uint8_t> bytes;
    MemorySink sink(bytes);
    Result r = write(sink, buffers);
    if (r) *out = std::move(bytes);
    return r;
}

Result unpack(const uint8_t* data, size_t size, std::vector<NamedBuffer>* out, const Config& config) {
    MemorySource src(data, size);
    return read_buffers(src, out, config);
}

// ---------------- files ----------------

Result write_file(const std::string& path,
                  const std::vector<std::string>& names,
                  const std::vector<int64_t>& sizes,
                  const EmitFn& emit)
{
    FilePtr f(std::fopen(path.c_str(), "wb"));
    if (!f) return fail(Error::Io, "cannot open output file: " + path);
    FileSink sink(f.get());
    Result r = write(sink, names, sizes, emit);
    if (!r) return r;
    if (std::fflush(f.get()) != 0)
        return fail(Error::Io, "failed flushing output file: " + path);
    return r;
}

Result write_file(const std::string& path, const std::vector<NamedBuffer>& buffers) {
    FilePtr f(std::fopen(path.c_str(), "wb"));
    if (!f) return fail(Error::Io, "cannot open output file: " + path);
    FileSink sink(f.get());
    Result r = write(sink, buffers);
    if (!r) return r;
    if (std::fflush(f.get()) != 0)
        return fail(Error::Io, "failed flushing output file: " + path);
    return r;
}

Result read_file(const std::string& path, std::vector<NamedBuffer>* out, const Config& config) {
    FilePtr f(std::fopen(path.c_str(), "rb"));
    if (!f) return fail(Error::Io, "cannot open input file: " + path);
    FileSource src(f.get());
    return read_buffers(src, out, config);
}

std::string get_version() {
    return "bfast 1.0.0";
}

} // namespace bfast
