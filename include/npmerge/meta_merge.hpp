#pragma once

#include "npmerge/meta_file.hpp"

#include <cstdint>
#include <optional>

namespace npmerge {

// Combine the sidecars of two concatenated recordings.
//
// The result is a copy of `second` (the output file is named after the second
// input, so its remaining keys describe the output best) with three keys
// replaced:
//
//   fileSizeBytes  total_bytes if given, else first + second
//   fileTimeSecs   total_bytes / (2 * nSavedChans * imSampRate) if total_bytes
//                  is given (channel count and rate from `second`), else
//                  first + second
//   firstSample    min(first, second)
//
// total_bytes should be the value returned by merge_bin_files() so that size
// and duration agree with what was actually written, including any time-window
// truncation.
//
// Throws MetadataParseError if a required key is missing or unparsable, or if
// the two records disagree on nSavedChans when total_bytes is given.
MetaRecord merge_meta_records(const MetaRecord& first,
                              const MetaRecord& second,
                              std::optional<uint64_t> total_bytes = std::nullopt);

} // namespace npmerge
