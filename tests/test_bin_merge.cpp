#include "npmerge/bin_merge.hpp"

#include "npmerge/errors.hpp"

#include "test_support.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace {

// Input buffer that remembers the largest single read request.
class RecordingReadBuf : public std::stringbuf {
public:
  explicit RecordingReadBuf(const std::string& s) : std::stringbuf(s, std::ios::in) {}

  std::streamsize max_request{0};
  int read_calls{0};

protected:
  std::streamsize xsgetn(char* s, std::streamsize n) override {
    ++read_calls;
    max_request = std::max(max_request, n);
    return std::stringbuf::xsgetn(s, n);
  }
};

// Output buffer that accepts `limit` bytes and then refuses further writes.
class FailingWriteBuf : public std::streambuf {
public:
  explicit FailingWriteBuf(size_t limit) : limit_(limit) {}

  size_t written{0};

protected:
  std::streamsize xsputn(const char*, std::streamsize n) override {
    if (written + static_cast<size_t>(n) > limit_) return 0;
    written += static_cast<size_t>(n);
    return n;
  }

  int_type overflow(int_type) override { return traits_type::eof(); }

private:
  size_t limit_;
};

} // namespace

int main() {
  using namespace npmerge;
  namespace fs = std::filesystem;

  const fs::path dir = npmerge_test::scratch_dir("npmerge_test_bin_merge");

  // 1) Whole-file merge: output is the byte-exact concatenation.
  {
    const std::vector<char> a = npmerge_test::pattern_bytes(10000, 1);
    const std::vector<char> b = npmerge_test::pattern_bytes(7777, 99);
    npmerge_test::write_bytes(dir / "a.bin", a);
    npmerge_test::write_bytes(dir / "b.bin", b);

    BinMergeInput in1;
    in1.path = (dir / "a.bin").string();
    BinMergeInput in2;
    in2.path = (dir / "b.bin").string();

    BinMergeOptions opt;
    opt.whole_file_chunk_bytes = 4096;  // force several chunks per file
    uint64_t last_done = 0;
    uint64_t last_total = 0;
    int callbacks = 0;
    opt.progress = [&](uint64_t done, uint64_t total) {
      assert(done > last_done);
      last_done = done;
      last_total = total;
      ++callbacks;
    };

    const fs::path out = dir / "out" / "ab.bin";
    const uint64_t n = merge_bin_files(in1, in2, out.string(), opt);
    assert(n == a.size() + b.size());
    assert(fs::file_size(out) == a.size() + b.size());

    std::vector<char> expect = a;
    expect.insert(expect.end(), b.begin(), b.end());
    assert(npmerge_test::read_bytes(out) == expect);

    assert(last_done == n);
    assert(last_total == n);
    assert(callbacks == 3 + 2);  // ceil(10000/4096) + ceil(7777/4096)
    assert(npmerge_test::count_entries_containing(dir / "out", ".tmp.") == 0);
  }

  // 2) Windowed extraction: 1000 time points at 100 Hz, 4 channels, int16.
  {
    const size_t n_samples = 1000;
    const int n_ch = 4;
    const std::vector<char> rec = npmerge_test::pattern_bytes(n_samples * n_ch * 2, 5);
    const std::vector<char> other = npmerge_test::pattern_bytes(3000, 17);
    npmerge_test::write_bytes(dir / "rec.ap.bin", rec);
    npmerge_test::write_text(dir / "rec.ap.meta", "imSampRate=100\nnSavedChans=4\n");
    npmerge_test::write_bytes(dir / "other.ap.bin", other);

    BinMergeInput in1;
    in1.path = (dir / "rec.ap.bin").string();
    in1.range = TimeRange{1.234, 5.678};
    in1.meta_path = (dir / "rec.ap.meta").string();

    BinMergeInput in2;
    in2.path = (dir / "other.ap.bin").string();

    const ByteRange r = resolve_input_range(in1);
    const uint64_t want = (567 - 123) * n_ch * 2;
    assert(r.size() == want);

    BinMergeOptions opt;
    opt.range_chunk_bytes = 1000;
    const fs::path out = dir / "windowed.ap.bin";
    const uint64_t n = merge_bin_files(in1, in2, out.string(), opt);
    assert(n == want + other.size());

    const std::vector<char> got = npmerge_test::read_bytes(out);
    assert(got.size() == n);
    const size_t off = 123 * n_ch * 2;
    assert(std::equal(got.begin(), got.begin() + static_cast<std::ptrdiff_t>(want),
                      rec.begin() + static_cast<std::ptrdiff_t>(off)));
    assert(std::equal(got.begin() + static_cast<std::ptrdiff_t>(want), got.end(), other.begin()));

    // A window that runs past the end of the file is clamped.
    BinMergeInput tail = in1;
    tail.range = TimeRange{9.0, 20.0};
    const ByteRange rt = resolve_input_range(tail);
    assert(rt.begin == 900u * n_ch * 2u);
    assert(rt.end == rec.size());

    // A range without its sidecar is a usage error.
    BinMergeInput no_meta = in1;
    no_meta.meta_path.clear();
    bool threw = false;
    try {
      (void)resolve_input_range(no_meta);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  // 3) Bounded memory: never more than one chunk per read call.
  {
    const std::vector<char> src = npmerge_test::pattern_bytes(100000, 3);
    RecordingReadBuf rb(std::string(src.begin(), src.end()));
    std::istream in(&rb);
    std::ostringstream out;

    const size_t chunk = 4096;
    const uint64_t n = copy_byte_range(in, out, 1000, 90000, chunk, nullptr, "memory");
    assert(n == 90000);
    assert(rb.max_request > 0);
    assert(rb.max_request <= static_cast<std::streamsize>(chunk));
    assert(rb.read_calls == static_cast<int>((90000 + chunk - 1) / chunk));

    const std::string s = out.str();
    assert(s.size() == 90000);
    assert(std::equal(s.begin(), s.end(), src.begin() + 1000));
  }

  // 4) Short read (source smaller than requested).
  {
    std::istringstream in(std::string(100, 'x'));
    std::ostringstream out;
    bool threw = false;
    try {
      (void)copy_byte_range(in, out, 0, 200, 64, nullptr, "short");
    } catch (const IoError& e) {
      threw = std::string(e.what()).find("short") != std::string::npos;
    }
    assert(threw);
  }

  // 5) Write failure inside the copy loop surfaces as IoError.
  {
    std::istringstream in(std::string(1000, 'y'));
    FailingWriteBuf wb(300);
    std::ostream out(&wb);
    bool threw = false;
    try {
      (void)copy_byte_range(in, out, 0, 1000, 100, nullptr, "src");
    } catch (const IoError&) {
      threw = true;
    }
    assert(threw);
    assert(wb.written == 300);
  }

  // 6) Failure mid-copy: the error reaches the caller, nothing is left behind.
  {
    npmerge_test::write_bytes(dir / "fail" / "a.bin", npmerge_test::pattern_bytes(50000, 2));
    npmerge_test::write_bytes(dir / "fail" / "b.bin", npmerge_test::pattern_bytes(50000, 4));

    BinMergeInput in1;
    in1.path = (dir / "fail" / "a.bin").string();
    BinMergeInput in2;
    in2.path = (dir / "fail" / "b.bin").string();

    BinMergeOptions opt;
    opt.whole_file_chunk_bytes = 8192;
    opt.progress = [](uint64_t done, uint64_t total) {
      if (done > total / 2) throw IoError("simulated write failure");
    };

    const fs::path out = dir / "fail" / "out" / "ab.bin";
    bool threw = false;
    try {
      (void)merge_bin_files(in1, in2, out.string(), opt);
    } catch (const IoError& e) {
      threw = std::string(e.what()) == "simulated write failure";
    }
    assert(threw);
    assert(!fs::exists(out));
    assert(npmerge_test::count_entries_containing(dir / "fail" / "out", ".tmp.") == 0);

    // An existing output is left untouched by a failed merge.
    npmerge_test::write_text(out, "previous");
    threw = false;
    try {
      (void)merge_bin_files(in1, in2, out.string(), opt);
    } catch (const IoError&) {
      threw = true;
    }
    assert(threw);
    assert(npmerge_test::read_text(out) == "previous");
  }

#if !defined(_WIN32)
  // 7) Rename failure: the destination is never removed to make room.
  {
    npmerge_test::write_bytes(dir / "busy" / "a.bin", npmerge_test::pattern_bytes(500, 6));
    npmerge_test::write_bytes(dir / "busy" / "b.bin", npmerge_test::pattern_bytes(500, 7));

    BinMergeInput in1;
    in1.path = (dir / "busy" / "a.bin").string();
    BinMergeInput in2;
    in2.path = (dir / "busy" / "b.bin").string();

    const fs::path out = dir / "busy" / "out.bin";
    fs::create_directories(out);
    bool threw = false;
    try {
      (void)merge_bin_files(in1, in2, out.string());
    } catch (const IoError&) {
      threw = true;
    }
    assert(threw);
    assert(fs::is_directory(out));
    assert(npmerge_test::count_entries_containing(dir / "busy", ".tmp.") == 0);
  }
#endif

  // 8) Missing input: IoError before any output appears.
  {
    BinMergeInput in1;
    in1.path = (dir / "does_not_exist.bin").string();
    BinMergeInput in2;
    in2.path = (dir / "a.bin").string();

    const fs::path out = dir / "missing_out.bin";
    bool threw = false;
    try {
      (void)merge_bin_files(in1, in2, out.string());
    } catch (const IoError&) {
      threw = true;
    }
    assert(threw);
    assert(!fs::exists(out));
  }

  fs::remove_all(dir);
  std::cout << "ok\n";
  return 0;
}
