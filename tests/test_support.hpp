#pragma once

// Test support helpers.
//
// Release builds usually define NDEBUG, which would compile <cassert>'s
// assert() away and silently turn tests into no-ops. Tests include this header
// and keep writing assert(expr); the macro is replaced by an always-on check
// that fails fast with a message on stderr.
//
// The header also carries the small file fixtures shared by the merge tests
// (scratch directories, raw byte files, sidecar text).

#include <cassert>  // bring in the standard macro (and its header guard)

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace npmerge_test {

inline void fail(const char* expr, const char* file, int line) {
  std::cerr << "Test assertion failed: " << expr << " (" << file << ":" << line << ")\n";
  std::exit(1);
}

// Fresh, empty directory under the system temp dir.
inline std::filesystem::path scratch_dir(const std::string& name) {
  const std::filesystem::path p = std::filesystem::temp_directory_path() / name;
  std::error_code ec;
  std::filesystem::remove_all(p, ec);
  std::filesystem::create_directories(p);
  return p;
}

// Deterministic test payload: byte i == (i * 7 + seed) & 0xFF.
inline std::vector<char> pattern_bytes(size_t n, unsigned seed) {
  std::vector<char> out(n);
  for (size_t i = 0; i < n; ++i) {
    out[i] = static_cast<char>((i * 7u + seed) & 0xFFu);
  }
  return out;
}

inline void write_bytes(const std::filesystem::path& p, const std::vector<char>& bytes) {
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

inline std::vector<char> read_bytes(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::vector<char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void write_text(const std::filesystem::path& p, const std::string& text) {
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  out << text;
}

inline std::string read_text(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Count directory entries whose name contains `needle` (e.g. ".tmp.").
inline size_t count_entries_containing(const std::filesystem::path& dir, const std::string& needle) {
  size_t n = 0;
  std::error_code ec;
  for (auto it = std::filesystem::directory_iterator(dir, ec);
       !ec && it != std::filesystem::directory_iterator();
       it.increment(ec)) {
    if (it->path().filename().string().find(needle) != std::string::npos) ++n;
  }
  return n;
}

} // namespace npmerge_test

#ifndef NPMERGE_TEST_ASSERT
#define NPMERGE_TEST_ASSERT(expr) \
  (static_cast<bool>(expr) ? (void)0 : ::npmerge_test::fail(#expr, __FILE__, __LINE__))
#endif

#ifdef assert
#undef assert
#endif
#define assert(expr) NPMERGE_TEST_ASSERT(expr)

#ifndef TEST_CHECK
#define TEST_CHECK(expr) NPMERGE_TEST_ASSERT(expr)
#endif
