#include "npmerge/meta_merge.hpp"

#include "npmerge/byte_range.hpp"
#include "npmerge/errors.hpp"
#include "npmerge/utils.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace npmerge {

MetaRecord merge_meta_records(const MetaRecord& first,
                              const MetaRecord& second,
                              std::optional<uint64_t> total_bytes) {
  const int64_t first_sample =
    std::min(first.get_int64("firstSample"), second.get_int64("firstSample"));

  MetaRecord out = second;

  if (total_bytes) {
    const int n_ch = second.get_int("nSavedChans");
    const double fs = second.get_double("imSampRate");
    if (first.has("nSavedChans") && first.get_int("nSavedChans") != n_ch) {
      throw MetadataParseError("nSavedChans differs between " + first.source() + " (" +
                               first.get("nSavedChans") + ") and " + second.source() +
                               " (" + second.get("nSavedChans") + ")");
    }
    if (n_ch <= 0 || !(fs > 0.0) || !std::isfinite(fs)) {
      throw MetadataParseError(second.source() +
                               ": nSavedChans and imSampRate must be > 0");
    }

    const double bytes_per_sec =
      static_cast<double>(kBytesPerSample) * static_cast<double>(n_ch) * fs;
    out.set("fileSizeBytes", std::to_string(*total_bytes));
    out.set("fileTimeSecs", format_double(static_cast<double>(*total_bytes) / bytes_per_sec));
  } else {
    const int64_t size = first.get_int64("fileSizeBytes") + second.get_int64("fileSizeBytes");
    const double secs = first.get_double("fileTimeSecs") + second.get_double("fileTimeSecs");
    out.set("fileSizeBytes", std::to_string(size));
    out.set("fileTimeSecs", format_double(secs));
  }

  out.set("firstSample", std::to_string(first_sample));
  return out;
}

} // namespace npmerge
