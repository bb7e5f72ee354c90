#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <vector>

namespace bfast {

// Ordered byte destination. The writer only ever appends.
struct Sink {
  virtual ~Sink() = default;

  virtual const char* name() const { return "sink"; }

  // Writes all n bytes or returns false.
  virtual bool write(const uint8_t* p, size_t n) = 0;

  // Bytes written since the sink was created.
  virtual uint64_t position() const = 0;
};

// Ordered byte origin. The reader only ever consumes forward.
struct Source {
  virtual ~Source() = default;

  virtual const char* name() const { return "source"; }

  // Reads exactly n bytes into dst or returns false (EOF or I/O error).
  virtual bool read(uint8_t* dst, size_t n) = 0;

  // Discards n bytes; the default reads them into a scratch buffer.
  virtual bool skip(uint64_t n);

  // Offset from the start of the stream. Returns false when the source
  // cannot report one (pipes, sockets); alignment checks are skipped then.
  virtual bool tell(uint64_t* pos) const { (void)pos; return false; }
};

// ----- FILE* backed -----
class FileSink : public Sink {
public:
  explicit FileSink(FILE* f) : f_(f) {}
  const char* name() const override { return "file"; }
  bool write(const uint8_t* p, size_t n) override;
  uint64_t position() const override { return written_; }

private:
  FILE*    f_;
  uint64_t written_ = 0;
};

class FileSource : public Source {
public:
  // Records the current file offset as the start of the stream; a FILE*
  // on which ftell fails is treated as non-seekable.
  explicit FileSource(FILE* f);
  const char* name() const override { return "file"; }
  bool read(uint8_t* dst, size_t n) override;
  bool tell(uint64_t* pos) const override;

private:
  FILE*    f_;
  bool     seekable_ = false;
  long     start_ = 0;
};

// ----- memory backed -----
class MemorySink : public Sink {
public:
  // Appends to out; out must outlive the sink.
  explicit MemorySink(std::vector<uint8_t>& out) : out_(out), start_(out.size()) {}
  const char* name() const override { return "memory"; }
  bool write(const uint8_t* p, size_t n) override {
    out_.insert(out_.end(), p, p + n);
    return true;
  }
  uint64_t position() const override { return out_.size() - start_; }

private:
  std::vector<uint8_t>& out_;
  size_t                start_;
};

class MemorySource : public Source {
public:
  MemorySource(const uint8_t* data, size_t size) : data_(data), size_(size) {}
  explicit MemorySource(const std::vector<uint8_t>& v) : MemorySource(v.data(), v.size()) {}
  const char* name() const override { return "memory"; }
  bool read(uint8_t* dst, size_t n) override;
  bool skip(uint64_t n) override;
  bool tell(uint64_t* pos) const override { *pos = pos_; return true; }

  // Bytes not yet consumed.
  size_t remaining() const { return size_ - pos_; }

private:
  const uint8_t* data_;
  size_t         size_;
  size_t         pos_ = 0;
};

// ----- helpers -----
bool write_zero_bytes(Sink& s, uint64_t n);
bool write_u64_le(Sink& s, uint64_t v);
bool read_u64_le(Source& src, uint64_t* v);

} // namespace bfast
