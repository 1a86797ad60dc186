#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace npmerge {

// SpikeGLX-style sidecar metadata (".meta").
//
// The file is a flat list of "key=value" lines:
//
//   imSampRate=30000
//   nSavedChans=385
//   fileSizeBytes=2310000
//   fileTimeSecs=1.0
//   firstSample=12345
//   ~snsChanMap=(384,384,1)(AP0;0:0)...
//
// There is no quoting or escaping. Values may themselves contain '=', so a line
// is split on the first '=' only.
//
// MetaRecord keeps entries in file order so that a record read from disk and
// written back unchanged is byte-identical (modulo line endings).
class MetaRecord {
public:
  using Entry = std::pair<std::string, std::string>;

  bool has(const std::string& key) const;

  // Returns the value for key. Throws MetadataParseError if key is missing.
  const std::string& get(const std::string& key) const;

  // Insert or replace. A replaced key keeps its original position.
  void set(const std::string& key, const std::string& value);

  // Typed accessors. Throw MetadataParseError when the key is missing or the
  // value does not parse; the message includes the key and the source label.
  int64_t get_int64(const std::string& key) const;
  int get_int(const std::string& key) const;
  double get_double(const std::string& key) const;

  const std::vector<Entry>& entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // Where the record came from (file path), used in error messages.
  const std::string& source() const { return source_; }
  void set_source(const std::string& source) { source_ = source; }

private:
  std::vector<Entry> entries_;
  std::string source_;
};

// Parse sidecar text.
//
// - blank lines are skipped
// - keys and values are trimmed (this also drops a trailing '\r')
// - a line with no '=' or an empty key throws MetadataParseError
//   ("<source_label>:<line>: ...")
MetaRecord parse_meta(std::istream& is, const std::string& source_label);

// Read a sidecar from disk. Throws IoError if the file cannot be opened.
MetaRecord read_meta_file(const std::string& path);

// Serialize as "key=value\n" lines in record order.
std::string format_meta(const MetaRecord& meta);

// Write a sidecar atomically (temp file + rename). Throws IoError on failure.
void write_meta_file(const std::string& path, const MetaRecord& meta);

// Sidecar extension for a binary-file extension:
//   "ap.bin" -> "ap.meta", "lf.bin" -> "lf.meta", "bin" -> "meta".
// Extensions without a "bin" suffix are returned unchanged.
std::string meta_extension_for(const std::string& bin_extension);

// Sidecar path next to a binary file: "<dir>/run_g0_t0.imec0.ap.bin" with
// extension "ap.bin" -> "<dir>/run_g0_t0.imec0.ap.meta".
//
// Throws std::invalid_argument if bin_path does not end with ".<bin_extension>".
std::string meta_path_for(const std::string& bin_path, const std::string& bin_extension);

} // namespace npmerge
