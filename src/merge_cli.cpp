#include "npmerge/errors.hpp"
#include "npmerge/merger.hpp"
#include "npmerge/run_meta.hpp"
#include "npmerge/utils.hpp"
#include "npmerge/version.hpp"

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace npmerge;

namespace {

struct Args {
  std::string dir1;
  std::string dir2;
  std::string outdir;
  std::string ext{"ap.bin"};

  std::optional<TimeRange> range1;
  std::optional<TimeRange> range2;

  std::vector<int> probes{0, 1, 2, 3};
  bool strict_counts{false};

  bool bin_only{false};
  bool meta_only{false};
  bool dry_run{false};

  bool quiet{false};
  bool run_meta{true};
};

static void print_help() {
  std::cout
    << "npmerge_cli\n\n"
    << "Concatenate matching SpikeGLX probe recordings from two run folders.\n"
    << "Probe folders (names containing imec<N>) are paired by probe number; files\n"
    << "inside a probe folder are paired in sorted order. For every pair the data of\n"
    << "--dir1 is written first, followed by the data of --dir2, and the .meta\n"
    << "sidecars are merged (fileSizeBytes, fileTimeSecs, firstSample).\n\n"
    << "Usage:\n"
    << "  npmerge_cli --dir1 run_a --dir2 run_b --outdir merged\n"
    << "  npmerge_cli --dir1 run_a --dir2 run_b --outdir merged --ext lf.bin\n"
    << "  npmerge_cli --dir1 run_a --dir2 run_b --outdir merged --range1 0:600 --range2 30:900\n\n"
    << "Options:\n"
    << "  --dir1 DIR              First source root (holds the probe folders)\n"
    << "  --dir2 DIR              Second source root; output layout and names follow it\n"
    << "  --outdir DIR            Output root (created if missing)\n"
    << "  --ext EXT               Binary extension to match (default: ap.bin)\n"
    << "  --range1 START:END      Only copy [START, END) seconds of each --dir1 file\n"
    << "  --range2 START:END      Only copy [START, END) seconds of each --dir2 file\n"
    << "  --probes LIST           Probe indices to scan, e.g. 0-3 or 0,2,5 (default: 0-3)\n"
    << "  --strict-counts         Fail if a probe has a different file count in the two roots\n"
    << "                          (default: pair up to the shorter list and warn)\n"
    << "  --bin-only              Merge binary files only\n"
    << "  --meta-only             Merge .meta sidecars only (sizes are summed from the inputs)\n"
    << "  --dry-run               Print the matched pairs and exit\n"
    << "  --no-run-meta           Do not write npmerge_run_meta.json\n"
    << "  --quiet                 Only print warnings and errors\n"
    << "  --version               Print the version and exit\n"
    << "  -h, --help              Show this help\n\n"
    << "Exit codes: 0 success, 1 error, 2 no probe shared by the two roots.\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << version_string() << "\n";
      std::exit(0);
    } else if (arg == "--dir1" && i + 1 < argc) {
      a.dir1 = argv[++i];
    } else if (arg == "--dir2" && i + 1 < argc) {
      a.dir2 = argv[++i];
    } else if ((arg == "--outdir" || arg == "--output") && i + 1 < argc) {
      a.outdir = argv[++i];
    } else if (arg == "--ext" && i + 1 < argc) {
      a.ext = argv[++i];
    } else if (arg == "--range1" && i + 1 < argc) {
      a.range1 = parse_time_range(argv[++i]);
    } else if (arg == "--range2" && i + 1 < argc) {
      a.range2 = parse_time_range(argv[++i]);
    } else if (arg == "--probes" && i + 1 < argc) {
      a.probes = parse_probe_indices(argv[++i]);
    } else if (arg == "--strict-counts") {
      a.strict_counts = true;
    } else if (arg == "--bin-only") {
      a.bin_only = true;
    } else if (arg == "--meta-only") {
      a.meta_only = true;
    } else if (arg == "--dry-run") {
      a.dry_run = true;
    } else if (arg == "--no-run-meta") {
      a.run_meta = false;
    } else if (arg == "--quiet") {
      a.quiet = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }

  if (a.dir1.empty() || a.dir2.empty() || a.outdir.empty()) {
    throw std::runtime_error("--dir1, --dir2 and --outdir are required");
  }
  if (a.bin_only && a.meta_only) {
    throw std::runtime_error("--bin-only and --meta-only are mutually exclusive");
  }
  return a;
}

static std::string join_probes(const std::vector<std::string>& probes) {
  std::string s;
  for (const auto& p : probes) {
    if (!s.empty()) s += ", ";
    s += "imec" + p;
  }
  return s;
}

static void warn_plan(const std::vector<std::string>& skipped,
                      const std::vector<std::string>& truncated) {
  if (!skipped.empty()) {
    std::cerr << "Warning: skipping probes found in only one root: " << join_probes(skipped)
              << "\n";
  }
  if (!truncated.empty()) {
    std::cerr << "Warning: file counts differ for " << join_probes(truncated)
              << "; extra files in the longer list were not merged\n";
  }
}

static void print_progress(uint64_t done, uint64_t total) {
  const double pct = total > 0 ? 100.0 * static_cast<double>(done) / static_cast<double>(total)
                               : 100.0;
  std::cout << "Progress: " << std::fixed << std::setprecision(2) << pct << "%\r"
            << std::defaultfloat << std::flush;
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);

    MergerConfig cfg;
    cfg.dir1 = args.dir1;
    cfg.dir2 = args.dir2;
    cfg.output_dir = args.outdir;
    cfg.extension = args.ext;
    cfg.range1 = args.range1;
    cfg.range2 = args.range2;
    cfg.discovery.probe_indices = args.probes;
    cfg.matching.strict_counts = args.strict_counts;
    cfg.create_output_dir = !args.dry_run;

    if (!args.quiet) {
      cfg.copy.progress = print_progress;
    }

    const Merger merger(cfg);

    if (args.dry_run) {
      const MatchPlan plan = merger.plan();
      warn_plan(plan.skipped_probes, plan.truncated_probes);
      for (const FilePair& p : plan.pairs) {
        std::cout << "imec" << p.probe << ": " << p.first << " + " << p.second << " -> "
                  << merger.output_path_for(p.second) << "\n";
      }
      return 0;
    }

    if (args.meta_only && (args.range1 || args.range2)) {
      std::cerr << "Warning: --meta-only ignores time ranges; sizes and durations are summed "
                   "from the input sidecars\n";
    }

    std::vector<std::string> outputs;
    uint64_t total_bytes = 0;

    MergeReport report;
    if (!args.meta_only) {
      if (!args.quiet) {
        std::cout << "Merging *." << merger.config().extension << " files from "
                  << args.dir1 << " and " << args.dir2 << " into " << args.outdir << "\n";
      }
      report = merger.merge_matching_files();
      warn_plan(report.skipped_probes, report.truncated_probes);
      for (const MergeResult& r : report.merged) {
        outputs.push_back(r.output);
        total_bytes += r.bytes_written;
        if (!args.quiet) {
          std::cout << "\nWrote " << r.output << " (" << r.bytes_written << " bytes)\n";
        }
      }
    }

    if (!args.bin_only) {
      const MetaFixReport meta = merger.fix_meta_files(args.meta_only ? nullptr : &report);
      if (args.meta_only) warn_plan(meta.skipped_probes, meta.truncated_probes);
      for (const MetaFixResult& r : meta.written) {
        outputs.push_back(r.output);
        if (!args.quiet) std::cout << "Wrote " << r.output << "\n";
      }
    }

    if (args.run_meta) {
      RunMetaInfo info;
      info.tool = "npmerge_cli";
      info.dir1 = args.dir1;
      info.dir2 = args.dir2;
      info.output_dir = args.outdir;
      info.extension = merger.config().extension;
      info.range1 = args.range1;
      info.range2 = args.range2;
      info.outputs = outputs;
      info.total_bytes_written = total_bytes;

      const std::string meta_path =
        (std::filesystem::u8path(args.outdir) / kRunMetaFileName).u8string();
      if (!write_run_meta_json(meta_path, info)) {
        std::cerr << "Warning: failed to write " << meta_path << "\n";
      }
    }

    if (!args.quiet) std::cout << "Merging complete.\n";
    return 0;

  } catch (const NoMatchingProbesError& e) {
    std::cerr << "Warning: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    std::cerr << "Run with --help for usage.\n";
    return 1;
  }
}
