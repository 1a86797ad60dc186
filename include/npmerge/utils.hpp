#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace npmerge {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
// Some Windows editors add one when a .meta sidecar is hand-edited.
std::string strip_utf8_bom(std::string s);

std::vector<std::string> split(const std::string& s, char delim);

bool ends_with(const std::string& s, const std::string& suffix);

// Strict numeric parsing helpers.
//
// These functions trim leading/trailing whitespace and then require that the
// entire remaining string is a valid number (no trailing "abc" fragments).
//
// Notes:
// - to_double() parses using the classic "C" locale so that '.' is treated as
//   the decimal separator regardless of the user's global locale.
// - Failures throw std::runtime_error with the offending text in the message.
int to_int(const std::string& s);
int64_t to_int64(const std::string& s);
double to_double(const std::string& s);

// Format a double in the shortest form that parses back to the same value.
//
// Integral values keep a trailing ".0" (3 -> "3.0") so that durations written
// into sidecars remain recognizably floating point. Non-finite values are
// written as "nan", "inf" or "-inf".
std::string format_double(double v);

void ensure_directory(const std::string& path);

// Generate a random hexadecimal token (2*n_bytes characters).
//
// Used to name temporary files next to their final destination.
std::string random_hex_token(size_t n_bytes = 16);

// Build a unique temporary path in the same directory as `path`:
//   <path>.tmp.<hex>
//
// The file is not created. Keeping it in the destination directory makes the
// final rename stay on one filesystem.
std::string make_temp_path_beside(const std::string& path);

// Atomically write a text file by writing to a temporary file in the same
// directory and renaming it into place (best-effort).
//
// Notes:
// - Parent directories are created.
// - On POSIX filesystems, rename within the same filesystem is atomic and a
//   failed rename leaves the destination untouched. On Windows only, an
//   existing regular-file destination is removed and the rename retried.
// - Any temporary file is removed on failure.
//
// Returns true on success, false on failure.
bool write_text_file_atomic(const std::string& path, const std::string& content);

// ISO-8601 timestamps used in the run manifest, e.g.
//   2026-01-15T13:37:42-05:00 (local)
//   2026-01-15T18:37:42Z      (UTC)
std::string now_string_local();
std::string now_string_utc();

// Escape a string for safe inclusion in JSON string values.
// The returned string does NOT include surrounding quotes.
std::string json_escape(const std::string& s);

} // namespace npmerge
