#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include "bfast/bfast.hpp"

using namespace bfast;

namespace {

// Reports positions shifted by a fixed offset, to simulate a stream that
// drifted off the 32-byte grid.
class ShiftedSource : public Source {
public:
  ShiftedSource(const std::vector<uint8_t>& v, uint64_t shift) : inner_(v), shift_(shift) {}
  bool read(uint8_t* dst, size_t n) override { return inner_.read(dst, n); }
  bool skip(uint64_t n) override { return inner_.skip(n); }
  bool tell(uint64_t* pos) const override {
    if (!inner_.tell(pos)) return false;
    *pos += shift_;
    return true;
  }

private:
  MemorySource inner_;
  uint64_t     shift_;
};

// A pipe-like source: no position available.
class UnseekableSource : public Source {
public:
  explicit UnseekableSource(const std::vector<uint8_t>& v) : inner_(v) {}
  bool read(uint8_t* dst, size_t n) override { return inner_.read(dst, n); }

private:
  MemorySource inner_;
};

std::vector<uint8_t> bytes_of(const std::string& s) { return std::vector<uint8_t>(s.begin(), s.end()); }

std::vector<NamedBuffer> sample_buffers() {
  return {
    {"first", bytes_of("hello")},
    {"empty", {}},
    {"third", std::vector<uint8_t>(70, 0x5A)},
  };
}

std::vector<uint8_t> sample_stream() {
  std::vector<uint8_t> out;
  Result r = pack(sample_buffers(), &out);
  EXPECT_TRUE(r) << r.error_message;
  return out;
}

void expect_sample(const std::vector<NamedBuffer>& got) {
  auto want = sample_buffers();
  ASSERT_EQ(got.size(), want.size());
  for (size_t i = 0; i < want.size(); ++i) {
    EXPECT_EQ(got[i].name, want[i].name);
    EXPECT_EQ(got[i].bytes, want[i].bytes);
  }
}

// Reverses every 8-byte header word (preamble and range table) in place.
void swap_header_words(std::vector<uint8_t>& bytes, size_t words) {
  for (size_t w = 0; w < words; ++w) {
    for (size_t i = 0; i < 4; ++i) std::swap(bytes[w * 8 + i], bytes[w * 8 + 7 - i]);
  }
}

} // namespace

TEST(StreamWriter, ProducesAlignedZeroPaddedLayout) {
  std::vector<uint8_t> out;
  MemorySink sink(out);
  Result r = write(sink, sample_buffers());
  ASSERT_TRUE(r) << r.error_message;

  Header h;
  ASSERT_TRUE(make_header({"first", "empty", "third"}, {5, 0, 70}, &h));
  EXPECT_EQ(out.size(), next_aligned(h.preamble.data_end));
  EXPECT_TRUE(is_aligned(out.size()));

  EXPECT_EQ(decode_u64_le(out.data()), MAGIC);
  EXPECT_EQ(decode_u64_le(out.data() + 8), h.preamble.data_start);
  EXPECT_EQ(decode_u64_le(out.data() + 16), h.preamble.data_end);
  EXPECT_EQ(decode_u64_le(out.data() + 24), 4u);
  for (size_t i = 0; i < h.ranges.size(); ++i) {
    EXPECT_EQ(decode_u64_le(out.data() + 32 + i * 16), h.ranges[i].begin);
    EXPECT_EQ(decode_u64_le(out.data() + 40 + i * 16), h.ranges[i].end);
  }
  for (uint64_t i = h.preamble.ranges_end(); i < h.preamble.data_start; ++i) EXPECT_EQ(out[i], 0) << i;

  const std::vector<uint8_t> blob = pack_strings(h.names);
  EXPECT_TRUE(std::equal(blob.begin(), blob.end(), out.begin() + h.ranges[0].begin));
  EXPECT_EQ(out[h.ranges[1].begin], 'h');
  for (uint64_t i = h.ranges[1].end; i < h.ranges[2].begin; ++i) EXPECT_EQ(out[i], 0) << i;
  EXPECT_EQ(out[h.ranges[3].begin], 0x5A);
}

TEST(StreamWriter, EmitMustWriteDeclaredSize) {
  std::vector<uint8_t> out;
  MemorySink sink(out);
  Result r = write(sink, {"a"}, {8},
    [](Sink& s, size_t, const std::string&, int64_t) -> Result {
      const uint8_t three[3] = {1, 2, 3};
      s.write(three, sizeof(three));
      return ok();
    });
  EXPECT_EQ(r.error, Error::BufferSizeMismatch);
}

TEST(StreamWriter, EmitFailuresAreReported) {
  std::vector<uint8_t> out;
  MemorySink sink(out);
  Result r = write(sink, {"a"}, {1},
    [](Sink&, size_t, const std::string&, int64_t) -> Result {
      throw std::runtime_error("disk on fire");
    });
  EXPECT_EQ(r.error, Error::CallbackFailed);
  EXPECT_NE(r.error_message.find("disk on fire"), std::string::npos);

  out.clear();
  MemorySink sink2(out);
  r = write(sink2, {"a"}, {1},
    [](Sink&, size_t, const std::string&, int64_t) -> Result {
      return fail(Error::Io, "source vanished");
    });
  EXPECT_EQ(r.error, Error::Io);
}

TEST(StreamWriter, RejectsBadSizesBeforeWriting) {
  std::vector<uint8_t> out;
  MemorySink sink(out);
  auto never = [](Sink&, size_t, const std::string&, int64_t) -> Result {
    ADD_FAILURE() << "emit must not run";
    return ok();
  };
  EXPECT_EQ(write(sink, {"a", "b"}, {1, -3}, never).error, Error::NegativeSize);
  EXPECT_EQ(write(sink, {"a", "b"}, {1}, never).error, Error::CountMismatch);
  EXPECT_EQ(write_body(sink, {"a"}, {-1}, never).error, Error::NegativeSize);
  EXPECT_TRUE(out.empty());
}

TEST(StreamWriter, WriteHeaderChecksRangeCount) {
  Header h;
  ASSERT_TRUE(make_header({"a"}, {4}, &h));
  h.names.push_back("b");
  std::vector<uint8_t> out;
  MemorySink sink(out);
  EXPECT_EQ(write_header(sink, h).error, Error::CountMismatch);
}

TEST(StreamReader, ReadsHeaderAndStopsAtFirstPayload) {
  std::vector<uint8_t> bytes = sample_stream();
  MemorySource src(bytes);
  Header h;
  Result r = read_header(src, &h);
  ASSERT_TRUE(r) << r.error_message;
  EXPECT_EQ(h.names, (std::vector<std::string>{"first", "empty", "third"}));
  uint64_t pos = 0;
  ASSERT_TRUE(src.tell(&pos));
  EXPECT_EQ(pos, h.ranges[1].begin);
}

TEST(StreamReader, RoundTripThroughCallbacks) {
  std::vector<uint8_t> bytes = sample_stream();
  MemorySource src(bytes);
  std::vector<std::pair<std::string, std::string>> seen;
  Header h;
  Result r = read_each(src,
    [&](Source& s, const std::string& name, uint64_t count) -> Result {
      std::string v(static_cast<size_t>(count), '\0');
      if (count > 0 && !s.read(reinterpret_cast<uint8_t*>(&v[0]), v.size()))
        return fail(Error::Io, "short");
      seen.emplace_back(name, v);
      return ok();
    },
    &h);
  ASSERT_TRUE(r) << r.error_message;
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen[0], std::make_pair(std::string("first"), std::string("hello")));
  EXPECT_EQ(seen[1].second, "");
  EXPECT_EQ(seen[2].second, std::string(70, 'Z'));
  EXPECT_EQ(h.preamble.num_arrays, 4);
  EXPECT_EQ(src.remaining(), 0u);
}

TEST(StreamReader, RejectsUnknownMagicBeforeAnythingElse) {
  std::vector<uint8_t> bytes = sample_stream();
  bytes[0] = 0x00;
  bytes[1] = 0x00;
  bytes[8] = 0xFF;   // data_start garbage too
  std::vector<NamedBuffer> out;
  Result r = unpack(bytes, &out);
  EXPECT_EQ(r.error, Error::MagicMismatch);
  EXPECT_TRUE(out.empty());
}

TEST(StreamReader, AcceptsByteSwappedHeader) {
  std::vector<uint8_t> bytes = sample_stream();
  Header h;
  ASSERT_TRUE(make_header({"first", "empty", "third"}, {5, 0, 70}, &h));
  swap_header_words(bytes, 4 + 2 * h.ranges.size());
  EXPECT_EQ(decode_u64_le(bytes.data()), MAGIC_SWAPPED_ENDIAN);

  std::vector<NamedBuffer> out;
  Result r = unpack(bytes, &out);
  ASSERT_TRUE(r) << r.error_message;
  expect_sample(out);

  Config strict;
  strict.accept_swapped = false;
  r = unpack(bytes, &out, strict);
  EXPECT_EQ(r.error, Error::MagicMismatch);
}

TEST(StreamReader, TruncatedStreamsFail) {
  std::vector<uint8_t> bytes = sample_stream();
  for (size_t cut : {size_t(0), size_t(16), size_t(40), size_t(100), bytes.size() - 40, bytes.size() - 1}) {
    std::vector<uint8_t> part(bytes.begin(), bytes.begin() + cut);
    std::vector<NamedBuffer> out;
    Result r = unpack(part, &out);
    EXPECT_FALSE(r) << "cut at " << cut;
    EXPECT_EQ(r.error, Error::Io) << "cut at " << cut << ": " << r.error_message;
  }
}

TEST(StreamReader, CorruptRangeTableIsRejected) {
  std::vector<uint8_t> bytes = sample_stream();
  // range 2 begin (entry 2, word 0) moved off the 32-byte grid
  uint8_t w[8];
  encode_u64_le(decode_u64_le(bytes.data() + 32 + 2 * 16) + 1, w);
  std::copy(w, w + 8, bytes.begin() + 32 + 2 * 16);
  std::vector<NamedBuffer> out;
  EXPECT_EQ(unpack(bytes, &out).error, Error::MisalignedOffset);
}

TEST(StreamReader, MisalignedNameBlobIsSameErrorOnAnySource) {
  std::vector<uint8_t> bytes = sample_stream();
  // range 0 begin 96 -> 97
  uint8_t w[8];
  encode_u64_le(decode_u64_le(bytes.data() + 32) + 1, w);
  std::copy(w, w + 8, bytes.begin() + 32);

  std::vector<NamedBuffer> out;
  MemorySource seekable(bytes);
  EXPECT_EQ(read_buffers(seekable, &out).error, Error::MisalignedOffset);
  UnseekableSource pipe(bytes);
  EXPECT_EQ(read_buffers(pipe, &out).error, Error::MisalignedOffset);
}

TEST(StreamReader, DetectsAlignmentDriftOnSeekableSources) {
  std::vector<uint8_t> bytes = sample_stream();
  ShiftedSource shifted(bytes, 1);
  std::vector<NamedBuffer> out;
  Result r = read_buffers(shifted, &out);
  EXPECT_EQ(r.error, Error::AlignmentDrift);

  ShiftedSource again(bytes, 1);
  Config lax;
  lax.check_alignment = false;
  r = read_buffers(again, &out, lax);
  ASSERT_TRUE(r) << r.error_message;
  expect_sample(out);
}

TEST(StreamReader, UnseekableSourcesTrustDeclaredSizes) {
  std::vector<uint8_t> bytes = sample_stream();
  UnseekableSource src(bytes);
  std::vector<NamedBuffer> out;
  Result r = read_buffers(src, &out);
  ASSERT_TRUE(r) << r.error_message;
  expect_sample(out);
}

TEST(StreamReader, CallbackMustConsumeWholeBuffer) {
  std::vector<uint8_t> bytes = sample_stream();
  MemorySource src(bytes);
  Result r = read_each(src,
    [](Source& s, const std::string&, uint64_t count) -> Result {
      if (count == 0) return ok();
      uint8_t b;
      return s.read(&b, 1) ? ok() : fail(Error::Io, "short");
    });
  EXPECT_EQ(r.error, Error::BufferSizeMismatch);
}

TEST(StreamReader, CallbackExceptionsBecomeErrors) {
  std::vector<uint8_t> bytes = sample_stream();
  MemorySource src(bytes);
  Result r = read_each(src,
    [](Source&, const std::string& name, uint64_t) -> Result {
      throw std::runtime_error("cannot handle " + name);
    });
  EXPECT_EQ(r.error, Error::CallbackFailed);
  EXPECT_NE(r.error_message.find("first"), std::string::npos);
}

TEST(StreamReader, NameBlobLimit) {
  std::vector<uint8_t> bytes = sample_stream();
  Config tiny;
  tiny.max_buffer_bytes = 4;
  std::vector<NamedBuffer> out;
  EXPECT_EQ(unpack(bytes, &out, tiny).error, Error::LimitExceeded);
}

TEST(FileStreams, WriteAndReadThroughFilePointers) {
  FILE* f = std::tmpfile();
  ASSERT_NE(f, nullptr);
  {
    FileSink sink(f);
    Result r = write(sink, sample_buffers());
    ASSERT_TRUE(r) << r.error_message;
    EXPECT_TRUE(is_aligned(sink.position()));
  }
  std::rewind(f);
  FileSource src(f);
  uint64_t pos = 1;
  ASSERT_TRUE(src.tell(&pos));
  EXPECT_EQ(pos, 0u);
  std::vector<NamedBuffer> out;
  Result r = read_buffers(src, &out);
  std::fclose(f);
  ASSERT_TRUE(r) << r.error_message;
  expect_sample(out);
}
