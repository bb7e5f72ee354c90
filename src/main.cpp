// src/main.cpp
#include "bfast/bfast.hpp"
#include "bfast/util.hpp"

#include <vector>
#include <string>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <cstdlib>
#include <exception>
#include <sys/stat.h>

using namespace bfast;

static bool g_verbose = false;

static void usage() {
  std::fprintf(stderr,
    "bfast: binary container for named, 32-byte aligned buffers\n"
    "Usage:\n"
    "  bfast pack [-o output_file] [--name NAME]... [--verbose] input_files...\n"
    "  bfast unpack [-i input_file] [-d output_dir] [--no-align-check] [--strict-endian]\n"
    "               [--max-buffer-mb N] [--verbose]\n"
    "  bfast list [-i input_file] [--no-align-check] [--strict-endian]\n"
    "Examples:\n"
    "  bfast pack -o mesh.bfast positions.bin indices.bin\n"
    "  bfast pack --name xs --name ys a.bin b.bin > out.bfast\n"
    "  bfast unpack -i mesh.bfast -d out/\n"
    "  cat mesh.bfast | bfast list\n");
}

// ---------------- pack ----------------

static int cmd_pack(const std::vector<std::string>& inputs,
                    const std::vector<std::string>& names_override,
                    FILE* out)
{
  if (inputs.empty()) { usage(); return 1; }
  if (!names_override.empty() && names_override.size() != inputs.size())
    die("error: --name given " + std::to_string(names_override.size()) +
        " times for " + std::to_string(inputs.size()) + " input files");

  std::vector<std::string> names;
  std::vector<int64_t> sizes;
  for (size_t i = 0; i < inputs.size(); ++i) {
    int64_t n = file_size(inputs[i]);
    if (n < 0) die("error: cannot stat input file: " + inputs[i]);
    names.push_back(names_override.empty() ? base_name(inputs[i]) : names_override[i]);
    sizes.push_back(n);
  }

  uint64_t total = 0;
  Result r = compute_size(names, sizes, &total);
  if (!r) die(std::string("error: ") + r.error_message);
  if (g_verbose)
    std::fprintf(stderr, "[pack] %zu buffers, %llu bytes\n",
                 names.size(), (unsigned long long)total);

  FileSink sink(out);
  r = write(sink, names, sizes,
    [&inputs](Sink& s, size_t index, const std::string& name, int64_t size) -> Result {
      FILE* f = std::fopen(inputs[index].c_str(), "rb");
      if (!f) return fail(Error::Io, "cannot open input file: " + inputs[index]);
      bool copied = copy_exact(f, s, static_cast<uint64_t>(size));
      std::fclose(f);
      if (!copied) return fail(Error::Io, "short copy of input file: " + inputs[index]);
      if (g_verbose)
        std::fprintf(stderr, "[pack] %s <- %s (%lld bytes)\n",
                     name.c_str(), inputs[index].c_str(), (long long)size);
      return ok();
    });
  if (!r) die(std::string("error: ") + error_name(r.error) + ": " + r.error_message);
  if (std::fflush(out) != 0) die("error: short write");
  return 0;
}

// ---------------- unpack ----------------

static bool safe_name(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos;
}

static int cmd_unpack(const Config& cfg, const std::string& dir, FILE* in)
{
  if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST)
    die("error: cannot create output directory: " + dir);

  FileSource src(in);
  size_t count = 0;
  Result r = read_each(src,
    [&](Source& s, const std::string& name, uint64_t n) -> Result {
      if (!safe_name(name))
        return fail(Error::CallbackFailed, "refusing to write buffer with unsafe name '" + name + "'");
      if (n > cfg.max_buffer_bytes)
        return fail(Error::LimitExceeded, "buffer '" + name + "' of " + std::to_string(n) + " bytes exceeds --max-buffer-mb");
      std::string path = dir + "/" + name;
      FILE* f = std::fopen(path.c_str(), "wb");
      if (!f) return fail(Error::Io, "cannot open output file: " + path);
      bool copied = copy_exact(s, f, n);
      bool closed = std::fclose(f) == 0;
      if (!copied || !closed) return fail(Error::Io, "failed writing output file: " + path);
      if (g_verbose)
        std::fprintf(stderr, "[unpack] %s (%llu bytes)\n", path.c_str(), (unsigned long long)n);
      ++count;
      return ok();
    },
    nullptr, cfg);
  if (!r) die(std::string("error: ") + error_name(r.error) + ": " + r.error_message);
  if (g_verbose) std::fprintf(stderr, "[unpack] %zu buffers\n", count);
  return 0;
}

// ---------------- list ----------------

static int cmd_list(const Config& cfg, FILE* in)
{
  FileSource src(in);
  Header h;
  Result r = read_header(src, &h, cfg);
  if (!r) die(std::string("error: ") + error_name(r.error) + ": " + r.error_message);
  if (g_verbose) std::fprintf(stderr, "[list] %s header ok\n", src.name());

  std::printf("data_start=%llu data_end=%llu num_arrays=%lld\n",
              (unsigned long long)h.preamble.data_start,
              (unsigned long long)h.preamble.data_end,
              (long long)h.preamble.num_arrays);
  for (size_t i = 1; i < h.ranges.size(); ++i) {
    const Range& rg = h.ranges[i];
    std::printf("%4zu  %12llu  %12llu  %12llu  %s\n", i - 1,
                (unsigned long long)rg.begin, (unsigned long long)rg.end,
                (unsigned long long)rg.count(), h.names[i - 1].c_str());
  }
  return 0;
}

// ---------------- main ----------------

int main(int argc, char** argv)
{
  if (argc < 2) { usage(); return 1; }
  std::string mode = argv[1];
  if (mode == "--version") { std::printf("%s\n", get_version().c_str()); return 0; }

  Config cfg;
  std::string output_file, output_dir = ".";
  std::vector<std::string> input_files;
  std::vector<std::string> names;

  for (int i=2;i<argc;++i) {
    std::string a = argv[i];
    if (a=="--name" && i+1<argc) { names.push_back(argv[++i]); }
    else if (a=="--no-align-check") { cfg.check_alignment = false; }
    else if (a=="--strict-endian") { cfg.accept_swapped = false; }
    else if (a=="--max-buffer-mb" && i+1<argc) {
      long mb = std::atol(argv[++i]);
      if (mb <= 0) { usage(); return 1; }
      cfg.max_buffer_bytes = (uint64_t)mb * 1024 * 1024;
    }
    else if (a=="--verbose" || a=="-v") { g_verbose = true; }
    else if (a=="-d" && i+1<argc) { output_dir = argv[++i]; }
    else if (a=="-i" || a=="--input") {
      if (i+1<argc) {
        input_files.push_back(argv[++i]);
      } else { usage(); return 1; }
    }
    else if (a=="-o" || a=="--output") {
      if (i+1<argc) {
        if (!output_file.empty()) { usage(); return 1; } // Only one output file allowed
        output_file = argv[++i];
      } else { usage(); return 1; }
    }
    else if (a[0] != '-') {
      input_files.push_back(a);
    }
    else { usage(); return 1; }
  }

  try {
    if (mode=="pack") {
      FILE* out = stdout;
      if (!output_file.empty()) {
        out = std::fopen(output_file.c_str(), "wb");
        if (!out) {
          std::fprintf(stderr, "Error opening output file: %s\n", output_file.c_str());
          return 1;
        }
      }
      int rc = cmd_pack(input_files, names, out);
      if (out != stdout && std::fclose(out) != 0) die("error: failed closing output file");
      return rc;
    }
    if (mode=="unpack" || mode=="list") {
      if (input_files.size() > 1) { usage(); return 1; }
      FILE* in = stdin;
      if (!input_files.empty()) {
        in = std::fopen(input_files[0].c_str(), "rb");
        if (!in) {
          std::fprintf(stderr, "Error opening input file: %s\n", input_files[0].c_str());
          return 1;
        }
      }
      int rc = mode=="unpack" ? cmd_unpack(cfg, output_dir, in) : cmd_list(cfg, in);
      if (in != stdin) std::fclose(in);
      return rc;
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "fatal: %s\n", e.what());
    return 2;
  }

  usage();
  return 1;
}
