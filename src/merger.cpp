#include "npmerge/merger.hpp"

#include "npmerge/errors.hpp"
#include "npmerge/meta_file.hpp"
#include "npmerge/meta_merge.hpp"
#include "npmerge/utils.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace npmerge {

const MergeResult* MergeReport::find_output(const std::string& output_path) const {
  const std::filesystem::path want = std::filesystem::u8path(output_path).lexically_normal();
  for (const auto& r : merged) {
    if (std::filesystem::u8path(r.output).lexically_normal() == want) return &r;
  }
  return nullptr;
}

Merger::Merger(MergerConfig cfg) : cfg_(std::move(cfg)) {
  while (!cfg_.extension.empty() && cfg_.extension.front() == '.') {
    cfg_.extension.erase(cfg_.extension.begin());
  }

  if (cfg_.dir1.empty() || cfg_.dir2.empty()) {
    throw std::invalid_argument("Both source directories are required");
  }
  if (cfg_.output_dir.empty()) {
    throw std::invalid_argument("Output directory is required");
  }
  if (cfg_.extension.empty()) {
    throw std::invalid_argument("File extension is required");
  }
  if (cfg_.discovery.probe_indices.empty()) {
    throw std::invalid_argument("At least one probe index must be scanned");
  }
  if (cfg_.copy.whole_file_chunk_bytes == 0 || cfg_.copy.range_chunk_bytes == 0) {
    throw std::invalid_argument("Copy chunk sizes must be > 0");
  }
  if (cfg_.range1) validate_time_range(*cfg_.range1);
  if (cfg_.range2) validate_time_range(*cfg_.range2);
  if ((cfg_.range1 || cfg_.range2) && meta_extension() == cfg_.extension) {
    throw std::invalid_argument("Time ranges need sidecar metadata, but extension '" +
                                cfg_.extension + "' has no .meta counterpart");
  }

  if (!cfg_.create_output_dir) return;
  try {
    ensure_directory(cfg_.output_dir);
  } catch (const std::exception& e) {
    throw IoError("Failed to create output directory " + cfg_.output_dir + ": " + e.what());
  }
}

std::string Merger::meta_extension() const {
  return meta_extension_for(cfg_.extension);
}

MatchPlan Merger::plan_for_extension(const std::string& extension) const {
  const ProbeFileSet files1 = find_probe_files(cfg_.dir1, extension, cfg_.discovery);
  const ProbeFileSet files2 = find_probe_files(cfg_.dir2, extension, cfg_.discovery);
  MatchPlan p = match_probe_pairs(files1, files2, cfg_.matching);
  if (p.common_probes.empty()) {
    throw NoMatchingProbesError("No probe number is shared by " + cfg_.dir1 + " and " +
                                cfg_.dir2 + " for *." + extension + " files");
  }
  return p;
}

MatchPlan Merger::plan() const {
  return plan_for_extension(cfg_.extension);
}

std::string Merger::output_path_for(const std::string& file2) const {
  const std::filesystem::path f = std::filesystem::u8path(file2).lexically_normal();
  const std::filesystem::path root = std::filesystem::u8path(cfg_.dir2).lexically_normal();
  const std::filesystem::path rel = f.parent_path().lexically_relative(root);

  if (rel.empty() || (rel.begin() != rel.end() && *rel.begin() == "..")) {
    throw std::invalid_argument(file2 + " is not inside " + cfg_.dir2);
  }

  return (std::filesystem::u8path(cfg_.output_dir) / rel / f.filename()).u8string();
}

std::optional<std::string> Merger::sidecar_if_needed(const std::string& bin_path,
                                                     const std::optional<TimeRange>& range) const {
  if (!range) return std::nullopt;
  return meta_path_for(bin_path, cfg_.extension);
}

MergeReport Merger::merge_matching_files() const {
  const MatchPlan p = plan();

  MergeReport report;
  report.skipped_probes = p.skipped_probes;
  report.truncated_probes = p.truncated_probes;

  for (const FilePair& pair : p.pairs) {
    BinMergeInput in1;
    in1.path = pair.first;
    in1.range = cfg_.range1;
    in1.meta_path = sidecar_if_needed(pair.first, cfg_.range1).value_or(std::string());

    BinMergeInput in2;
    in2.path = pair.second;
    in2.range = cfg_.range2;
    in2.meta_path = sidecar_if_needed(pair.second, cfg_.range2).value_or(std::string());

    MergeResult r;
    r.probe = pair.probe;
    r.input1 = pair.first;
    r.input2 = pair.second;
    r.output = output_path_for(pair.second);
    r.bytes_written = merge_bin_files(in1, in2, r.output, cfg_.copy);
    report.merged.push_back(std::move(r));
  }

  return report;
}

MetaFixReport Merger::fix_meta_files(const MergeReport* copied) const {
  const std::string meta_ext = meta_extension();
  if (meta_ext == cfg_.extension) {
    throw std::invalid_argument("Extension '" + cfg_.extension +
                                "' has no .meta counterpart");
  }

  const MatchPlan p = plan_for_extension(meta_ext);

  MetaFixReport report;
  report.skipped_probes = p.skipped_probes;
  report.truncated_probes = p.truncated_probes;

  const std::string meta_suffix = "." + meta_ext;
  for (const FilePair& pair : p.pairs) {
    const MetaRecord meta1 = read_meta_file(pair.first);
    const MetaRecord meta2 = read_meta_file(pair.second);

    MetaFixResult r;
    r.probe = pair.probe;
    r.output = output_path_for(pair.second);

    std::optional<uint64_t> total;
    if (copied) {
      const std::string bin_output =
        r.output.substr(0, r.output.size() - meta_suffix.size()) + "." + cfg_.extension;
      if (const MergeResult* m = copied->find_output(bin_output)) {
        total = m->bytes_written;
        r.used_copied_size = true;
      }
    }

    write_meta_file(r.output, merge_meta_records(meta1, meta2, total));
    report.written.push_back(std::move(r));
  }

  return report;
}

MergeReport Merger::run(MetaFixReport* meta_report) const {
  MergeReport report = merge_matching_files();
  MetaFixReport meta = fix_meta_files(&report);
  if (meta_report) *meta_report = std::move(meta);
  return report;
}

} // namespace npmerge
