#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace npmerge {

// Probe folder discovery and cross-root matching.
//
// A SpikeGLX run directory holds one subfolder per probe, named after the run
// with an "imec<N>" token, e.g.
//
//   <root>/run_g0/run_g0_imec0/run_g0_t0.imec0.ap.bin
//                             /run_g0_t0.imec0.ap.meta
//   <root>/run_g0/run_g0_imec1/...
//
// The roots passed to find_probe_files() are the directories that directly
// contain the probe folders.

struct DiscoveryOptions {
  // One scan pass per index: a pass selects every subdirectory of the root
  // whose name contains "imec<index>".
  std::vector<int> probe_indices{0, 1, 2, 3};
};

// Probe folder path -> lexicographically sorted file paths (acquisition order).
using ProbeFileSet = std::map<std::string, std::vector<std::string>>;

// Probe number (digits as written in the folder name) -> probe folder path.
using ProbeMap = std::map<std::string, std::string>;

// Find files named "*.<extension>" inside the probe folders of `root`.
//
// - folders without a matching file are omitted
// - hidden entries (leading '.') are ignored
// - a missing or unreadable root yields an empty set
ProbeFileSet find_probe_files(const std::string& root,
                              const std::string& extension,
                              const DiscoveryOptions& opt = DiscoveryOptions());

// Digits following the first "imec" in the last path component, e.g.
//   "/data/run_g0_imec12" -> "12", "/data/run_g0" -> nullopt.
std::optional<std::string> extract_probe_number(const std::string& folder);

// Build the probe number -> folder map for one root.
//
// Throws AmbiguousProbeError if two folders carry the same probe number.
ProbeMap build_probe_map(const ProbeFileSet& files);

struct FilePair {
  std::string probe;   // probe number shared by both files
  std::string first;   // file from the first root
  std::string second;  // file from the second root (names the output)
};

struct MatchOptions {
  // If true, a probe whose file lists differ in length throws
  // FileCountMismatchError instead of being truncated to the shorter list.
  bool strict_counts{false};
};

struct MatchPlan {
  std::vector<FilePair> pairs;

  // Probe numbers present in both roots (ascending).
  std::vector<std::string> common_probes;

  // Probe numbers present in only one root (ascending). Not an error.
  std::vector<std::string> skipped_probes;

  // Common probes whose file lists had different lengths; pairing stopped at
  // the shorter list.
  std::vector<std::string> truncated_probes;
};

// Pair files of the two roots: probe by probe (ascending probe number), then
// position by position within each probe's sorted list.
MatchPlan match_probe_pairs(const ProbeFileSet& files1,
                            const ProbeFileSet& files2,
                            const MatchOptions& opt = MatchOptions());

// Parse a probe index list for DiscoveryOptions:
//   "0-3" -> {0,1,2,3}, "0,2,5" -> {0,2,5}, "1" -> {1}, "0-1,4" -> {0,1,4}
//
// Indices are de-duplicated and sorted. Throws std::invalid_argument on
// malformed input or negative indices.
std::vector<int> parse_probe_indices(const std::string& s);

} // namespace npmerge
