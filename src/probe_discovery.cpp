#include "npmerge/probe_discovery.hpp"

#include "npmerge/errors.hpp"
#include "npmerge/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>
#include <set>
#include <stdexcept>

namespace npmerge {

static std::vector<std::string> list_files_with_extension(const std::filesystem::path& dir,
                                                          const std::string& extension) {
  std::vector<std::string> out;
  const std::string suffix = "." + extension;

  std::error_code ec;
  for (auto it = std::filesystem::directory_iterator(dir, ec);
       !ec && it != std::filesystem::directory_iterator();
       it.increment(ec)) {
    const std::string name = it->path().filename().u8string();
    if (name.empty() || name[0] == '.') continue;
    if (!ends_with(name, suffix)) continue;
    std::error_code st_ec;
    if (!it->is_regular_file(st_ec)) continue;
    out.push_back(it->path().u8string());
  }

  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

ProbeFileSet find_probe_files(const std::string& root,
                              const std::string& extension,
                              const DiscoveryOptions& opt) {
  ProbeFileSet out;
  const std::filesystem::path root_path = std::filesystem::u8path(root);

  std::error_code ec;
  if (!std::filesystem::is_directory(root_path, ec)) return out;

  for (int index : opt.probe_indices) {
    const std::string token = "imec" + std::to_string(index);

    ec.clear();
    for (auto it = std::filesystem::directory_iterator(root_path, ec);
         !ec && it != std::filesystem::directory_iterator();
         it.increment(ec)) {
      const std::string name = it->path().filename().u8string();
      if (name.empty() || name[0] == '.') continue;
      if (name.find(token) == std::string::npos) continue;
      std::error_code st_ec;
      if (!it->is_directory(st_ec)) continue;

      const std::string folder = it->path().u8string();
      if (out.count(folder) != 0) continue;

      std::vector<std::string> files = list_files_with_extension(it->path(), extension);
      if (!files.empty()) out[folder] = std::move(files);
    }
  }

  return out;
}

std::optional<std::string> extract_probe_number(const std::string& folder) {
  static const std::regex re("imec(\\d+)");
  const std::string name = std::filesystem::u8path(folder).filename().u8string();
  std::smatch m;
  if (!std::regex_search(name, m, re)) return std::nullopt;
  return m[1].str();
}

ProbeMap build_probe_map(const ProbeFileSet& files) {
  ProbeMap out;
  for (const auto& kv : files) {
    const std::optional<std::string> probe = extract_probe_number(kv.first);
    if (!probe) continue;

    const auto it = out.find(*probe);
    if (it != out.end()) {
      throw AmbiguousProbeError("Probe imec" + *probe + " matches more than one folder: " +
                                it->second + " and " + kv.first);
    }
    out[*probe] = kv.first;
  }
  return out;
}

static bool probe_less(const std::string& a, const std::string& b) {
  // Compare digit strings numerically ("2" < "10"), ties broken by text ("01" vs "1").
  const std::string::size_type a0 = std::min(a.find_first_not_of('0'), a.size());
  const std::string::size_type b0 = std::min(b.find_first_not_of('0'), b.size());
  const std::string::size_type alen = a.size() - a0;
  const std::string::size_type blen = b.size() - b0;
  if (alen != blen) return alen < blen;
  const int c = a.compare(a0, alen, b, b0, blen);
  if (c != 0) return c < 0;
  return a < b;
}

MatchPlan match_probe_pairs(const ProbeFileSet& files1,
                            const ProbeFileSet& files2,
                            const MatchOptions& opt) {
  const ProbeMap map1 = build_probe_map(files1);
  const ProbeMap map2 = build_probe_map(files2);

  MatchPlan plan;
  for (const auto& kv : map1) {
    if (map2.count(kv.first) != 0) {
      plan.common_probes.push_back(kv.first);
    } else {
      plan.skipped_probes.push_back(kv.first);
    }
  }
  for (const auto& kv : map2) {
    if (map1.count(kv.first) == 0) plan.skipped_probes.push_back(kv.first);
  }
  std::sort(plan.common_probes.begin(), plan.common_probes.end(), probe_less);
  std::sort(plan.skipped_probes.begin(), plan.skipped_probes.end(), probe_less);

  for (const std::string& probe : plan.common_probes) {
    const std::vector<std::string>& list1 = files1.at(map1.at(probe));
    const std::vector<std::string>& list2 = files2.at(map2.at(probe));

    if (list1.size() != list2.size()) {
      if (opt.strict_counts) {
        throw FileCountMismatchError("Probe imec" + probe + ": " +
                                     std::to_string(list1.size()) + " file(s) in " +
                                     map1.at(probe) + " but " +
                                     std::to_string(list2.size()) + " in " + map2.at(probe));
      }
      plan.truncated_probes.push_back(probe);
    }

    const size_t n = std::min(list1.size(), list2.size());
    for (size_t i = 0; i < n; ++i) {
      plan.pairs.push_back(FilePair{probe, list1[i], list2[i]});
    }
  }

  return plan;
}

std::vector<int> parse_probe_indices(const std::string& s) {
  std::set<int> out;
  for (const std::string& raw : split(s, ',')) {
    const std::string item = trim(raw);
    if (item.empty()) {
      throw std::invalid_argument("Empty entry in probe list '" + s + "'");
    }

    try {
      const size_t dash = item.find('-', 1);
      if (dash == std::string::npos) {
        const int v = to_int(item);
        if (v < 0) throw std::invalid_argument("negative index");
        out.insert(v);
        continue;
      }

      const int lo = to_int(item.substr(0, dash));
      const int hi = to_int(item.substr(dash + 1));
      if (lo < 0 || hi < lo) throw std::invalid_argument("bad range");
      for (int v = lo; v <= hi; ++v) out.insert(v);
    } catch (const std::exception& e) {
      throw std::invalid_argument("Invalid probe list entry '" + item + "' in '" + s +
                                  "': " + e.what());
    }
  }

  if (out.empty()) throw std::invalid_argument("Probe list is empty");
  return std::vector<int>(out.begin(), out.end());
}

} // namespace npmerge
