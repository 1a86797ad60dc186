#pragma once

#include "npmerge/byte_range.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace npmerge {

// Read sizes used by the chunked copy. A whole-file copy uses large reads for
// throughput; a windowed copy uses smaller reads.
constexpr size_t kWholeFileChunkBytes = static_cast<size_t>(128) * 1024 * 1024;
constexpr size_t kRangeChunkBytes = static_cast<size_t>(1) * 1024 * 1024;

// Called after every chunk with the bytes written so far and the planned total.
using ProgressCallback = std::function<void(uint64_t bytes_done, uint64_t bytes_total)>;

struct BinMergeOptions {
  size_t whole_file_chunk_bytes{kWholeFileChunkBytes};
  size_t range_chunk_bytes{kRangeChunkBytes};

  // Optional. An exception thrown from the callback aborts the merge like any
  // I/O error (the temporary output is removed and the exception propagates).
  ProgressCallback progress;
};

// One side of a merge.
//
// If range is set, meta_path must name the sidecar holding imSampRate and
// nSavedChans for this file; only the matching byte window is copied.
// Otherwise the whole file is copied.
struct BinMergeInput {
  std::string path;
  std::optional<TimeRange> range;
  std::string meta_path;
};

// Resolve the byte window that will be copied from one input, clamped to the
// file's actual size.
//
// Throws IoError if the file cannot be stat'ed, MetadataParseError for a bad
// sidecar, std::invalid_argument if a range is given without a sidecar.
ByteRange resolve_input_range(const BinMergeInput& input);

// Copy `count` bytes starting at `begin` from `in` to `out`, reading at most
// `chunk_bytes` per read call into a single reused buffer.
//
// on_chunk (optional) receives the running count after every chunk.
// `label` names the source in error messages.
//
// Throws IoError on a failed seek, short read or failed write.
// Returns the number of bytes copied (== count on success).
uint64_t copy_byte_range(std::istream& in,
                         std::ostream& out,
                         uint64_t begin,
                         uint64_t count,
                         size_t chunk_bytes,
                         const std::function<void(uint64_t)>& on_chunk,
                         const std::string& label);

// Write the selected window of `first` followed by the selected window of
// `second` into output_path.
//
// The data is written to "<output_path>.tmp.<hex>" and renamed into place only
// after every byte has been flushed, so output_path either holds the complete
// result or is left untouched. On failure the temporary file is removed and
// the error is rethrown. Parent directories of output_path are created.
//
// Returns the total number of bytes written.
uint64_t merge_bin_files(const BinMergeInput& first,
                         const BinMergeInput& second,
                         const std::string& output_path,
                         const BinMergeOptions& opt = BinMergeOptions());

} // namespace npmerge
