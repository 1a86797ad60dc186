#include "npmerge/byte_range.hpp"

#include "npmerge/errors.hpp"
#include "npmerge/meta_file.hpp"
#include "npmerge/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace npmerge {

void validate_time_range(const TimeRange& r) {
  if (!std::isfinite(r.start_sec) || !std::isfinite(r.end_sec)) {
    throw std::invalid_argument("Time range bounds must be finite");
  }
  if (r.start_sec < 0.0) {
    throw std::invalid_argument("Time range start must be >= 0 (got " +
                                format_double(r.start_sec) + ")");
  }
  if (!(r.end_sec > r.start_sec)) {
    throw std::invalid_argument("Time range end must be greater than start (got " +
                                format_double(r.start_sec) + ":" +
                                format_double(r.end_sec) + ")");
  }
}

TimeRange parse_time_range(const std::string& s) {
  const std::vector<std::string> parts = split(trim(s), ':');
  if (parts.size() != 2) {
    throw std::invalid_argument("Expected time range as START:END seconds, got '" + s + "'");
  }
  TimeRange r;
  try {
    r.start_sec = to_double(parts[0]);
    r.end_sec = to_double(parts[1]);
  } catch (const std::exception& e) {
    throw std::invalid_argument("Invalid time range '" + s + "': " + e.what());
  }
  validate_time_range(r);
  return r;
}

// Saturates at UINT64_MAX; clamp_byte_range() then caps the offset at the file size.
static uint64_t seconds_to_byte_offset(double sec, double fs_hz, int n_channels) {
  const uint64_t kMax = std::numeric_limits<uint64_t>::max();
  const uint64_t bytes_per_time_point = static_cast<uint64_t>(n_channels) * kBytesPerSample;
  const double samples = std::floor(sec * fs_hz);
  // 2^64 is exact as a double; anything below it converts without overflow.
  if (!(samples < 18446744073709551616.0)) return kMax;
  const uint64_t n = static_cast<uint64_t>(samples);
  if (n > kMax / bytes_per_time_point) return kMax;
  return n * bytes_per_time_point;
}

ByteRange time_range_to_byte_range(const TimeRange& r, double fs_hz, int n_channels) {
  validate_time_range(r);
  if (!(fs_hz > 0.0) || !std::isfinite(fs_hz)) {
    throw std::invalid_argument("Sampling rate must be > 0");
  }
  if (n_channels <= 0) {
    throw std::invalid_argument("Channel count must be > 0");
  }

  ByteRange out;
  out.begin = seconds_to_byte_offset(r.start_sec, fs_hz, n_channels);
  out.end = seconds_to_byte_offset(r.end_sec, fs_hz, n_channels);
  return out;
}

ByteRange time_range_to_byte_range(const TimeRange& r, const MetaRecord& meta) {
  const double fs = meta.get_double("imSampRate");
  const int n_ch = meta.get_int("nSavedChans");
  if (!(fs > 0.0) || !std::isfinite(fs)) {
    throw MetadataParseError(meta.source() + ": imSampRate must be > 0");
  }
  if (n_ch <= 0) {
    throw MetadataParseError(meta.source() + ": nSavedChans must be > 0");
  }
  return time_range_to_byte_range(r, fs, n_ch);
}

ByteRange clamp_byte_range(const ByteRange& r, uint64_t file_size) {
  ByteRange out = r;
  out.end = std::min(out.end, file_size);
  out.begin = std::min(out.begin, out.end);
  return out;
}

} // namespace npmerge
