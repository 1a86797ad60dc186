#pragma once

#include "npmerge/bin_merge.hpp"
#include "npmerge/byte_range.hpp"
#include "npmerge/probe_discovery.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace npmerge {

struct MergerConfig {
  std::string dir1;        // first source root (its data comes first in each output)
  std::string dir2;        // second source root (names and lays out the outputs)
  std::string output_dir;  // created by Merger's constructor unless create_output_dir is false

  // Binary extension to match, without the leading dot (e.g. "ap.bin", "lf.bin").
  // A leading dot is tolerated and removed.
  std::string extension{"ap.bin"};

  // Optional per-root time windows (seconds from the start of each file).
  std::optional<TimeRange> range1;
  std::optional<TimeRange> range2;

  DiscoveryOptions discovery;
  MatchOptions matching;

  // Chunk sizes and progress reporting for the binary copy.
  BinMergeOptions copy;

  // False for plan-only use (plan(), output_path_for()). The merge and meta
  // steps still create the directories they write into.
  bool create_output_dir{true};
};

// One merged binary file.
struct MergeResult {
  std::string probe;
  std::string input1;
  std::string input2;
  std::string output;
  uint64_t bytes_written{0};
};

// One merged sidecar.
struct MetaFixResult {
  std::string probe;
  std::string output;
  bool used_copied_size{false};  // true if the size came from a MergeReport
};

struct MergeReport {
  std::vector<MergeResult> merged;
  std::vector<std::string> skipped_probes;
  std::vector<std::string> truncated_probes;

  // Result for a binary output path, or nullptr.
  const MergeResult* find_output(const std::string& output_path) const;
};

struct MetaFixReport {
  std::vector<MetaFixResult> written;
  std::vector<std::string> skipped_probes;
  std::vector<std::string> truncated_probes;
};

// Merges matching recordings from two SpikeGLX run folders into a third.
class Merger {
public:
  // Validates the configuration (std::invalid_argument) and creates
  // output_dir when create_output_dir is set (IoError on failure).
  explicit Merger(MergerConfig cfg);

  const MergerConfig& config() const { return cfg_; }

  // Sidecar extension matching config().extension ("ap.bin" -> "ap.meta").
  std::string meta_extension() const;

  // Discovery and matching only; nothing is written.
  MatchPlan plan() const;

  // Output path for a file of the second root:
  //   output_dir / relative(parent(file2), dir2) / filename(file2)
  std::string output_path_for(const std::string& file2) const;

  // Concatenate every matched pair of binary files.
  //
  // Throws NoMatchingProbesError if the roots share no probe number. Any other
  // error aborts the run; outputs completed before the failure stay in place.
  MergeReport merge_matching_files() const;

  // Merge every matched pair of sidecars.
  //
  // If `copied` holds the binary output corresponding to a sidecar, its exact
  // byte count drives fileSizeBytes/fileTimeSecs. Otherwise the inputs'
  // own fileSizeBytes/fileTimeSecs are summed.
  //
  // Throws NoMatchingProbesError if the roots share no probe number.
  MetaFixReport fix_meta_files(const MergeReport* copied = nullptr) const;

  // merge_matching_files() followed by fix_meta_files() with its report.
  MergeReport run(MetaFixReport* meta_report = nullptr) const;

private:
  MatchPlan plan_for_extension(const std::string& extension) const;
  std::optional<std::string> sidecar_if_needed(const std::string& bin_path,
                                               const std::optional<TimeRange>& range) const;

  MergerConfig cfg_;
};

} // namespace npmerge
