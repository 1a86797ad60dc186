#pragma once

#include "npmerge/byte_range.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace npmerge {

// Description of one npmerge invocation, recorded next to its outputs.
struct RunMetaInfo {
  std::string tool;         // executable name, e.g. "npmerge_cli"
  std::string dir1;
  std::string dir2;
  std::string output_dir;
  std::string extension;
  std::optional<TimeRange> range1;
  std::optional<TimeRange> range2;

  // Paths of written files; converted to paths relative to output_dir.
  std::vector<std::string> outputs;
  uint64_t total_bytes_written{0};
};

// Write <output_dir>/npmerge_run_meta.json style manifests (lightweight JSON
// emitter, no JSON dependency).
//
// Keys written (top-level):
//   - Tool, Version, BuildType, Compiler, CppStandard
//   - TimestampLocal, TimestampUTC
//   - Input1, Input2, OutputDir, Extension
//   - Range1, Range2 ({"StartSec": x, "EndSec": y} or null)
//   - TotalBytesWritten
//   - Outputs (array of paths relative to OutputDir, '/' separated)
//
// The file is written atomically. Returns true on success, false on write
// failure.
bool write_run_meta_json(const std::string& json_path, const RunMetaInfo& info);

// Default manifest file name inside the output directory.
constexpr const char* kRunMetaFileName = "npmerge_run_meta.json";

} // namespace npmerge
