#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace npmerge {

class MetaRecord;

// Samples are interleaved signed 16-bit integers: one int16 per saved channel
// per time point.
constexpr uint64_t kBytesPerSample = 2;

// Time window in seconds relative to the start of a file.
struct TimeRange {
  double start_sec{0.0};
  double end_sec{0.0};
};

// Half-open byte interval [begin, end).
struct ByteRange {
  uint64_t begin{0};
  uint64_t end{0};

  uint64_t size() const { return end > begin ? end - begin : 0; }
};

// Throws std::invalid_argument unless 0 <= start_sec < end_sec and both are finite.
void validate_time_range(const TimeRange& r);

// Parse "START:END" (seconds), e.g. "0:600" or "12.5:30".
// The result is validated with validate_time_range().
TimeRange parse_time_range(const std::string& s);

// Translate a time window into a byte window:
//
//   begin = floor(start_sec * fs_hz) * n_channels * 2
//   end   = floor(end_sec   * fs_hz) * n_channels * 2
//
// Both bounds land on a time-point boundary, so the result always holds a
// whole number of interleaved samples. A bound too large for uint64_t
// saturates at UINT64_MAX, which clamp_byte_range() reduces to the file size.
//
// Throws std::invalid_argument for an invalid range, fs_hz <= 0 or n_channels <= 0.
ByteRange time_range_to_byte_range(const TimeRange& r, double fs_hz, int n_channels);

// Same, reading fs from "imSampRate" and channel count from "nSavedChans".
// Throws MetadataParseError if either key is missing, unparsable or non-positive.
ByteRange time_range_to_byte_range(const TimeRange& r, const MetaRecord& meta);

// Clamp a byte window to a file of file_size bytes (end first, then begin <= end).
ByteRange clamp_byte_range(const ByteRange& r, uint64_t file_size);

} // namespace npmerge
