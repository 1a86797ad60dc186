#include "npmerge/run_meta.hpp"

#include "npmerge/utils.hpp"
#include "npmerge/version.hpp"

#include <filesystem>
#include <sstream>
#include <unordered_set>

namespace npmerge {

static std::string relative_output(const std::string& output_dir, const std::string& path) {
  const std::filesystem::path p = std::filesystem::u8path(path).lexically_normal();
  const std::filesystem::path base = std::filesystem::u8path(output_dir).lexically_normal();
  std::filesystem::path rel = p.lexically_relative(base);
  if (rel.empty() || *rel.begin() == "..") rel = p;
  return rel.generic_u8string();
}

bool write_run_meta_json(const std::string& json_path, const RunMetaInfo& info) {
  std::ostringstream out;

  auto write_range = [&](const std::optional<TimeRange>& r) {
    if (!r) {
      out << "null";
      return;
    }
    out << "{\"StartSec\": " << format_double(r->start_sec)
        << ", \"EndSec\": " << format_double(r->end_sec) << "}";
  };

  out << "{\n";
  out << "  \"Tool\": \"" << json_escape(info.tool) << "\",\n";
  out << "  \"Version\": \"" << json_escape(version_string()) << "\",\n";
  out << "  \"BuildType\": \"" << json_escape(build_type_string()) << "\",\n";
  out << "  \"Compiler\": \"" << json_escape(compiler_string()) << "\",\n";
  out << "  \"CppStandard\": \"" << json_escape(cpp_standard_string()) << "\",\n";
  out << "  \"TimestampLocal\": \"" << json_escape(now_string_local()) << "\",\n";
  out << "  \"TimestampUTC\": \"" << json_escape(now_string_utc()) << "\",\n";
  out << "  \"Input1\": \"" << json_escape(info.dir1) << "\",\n";
  out << "  \"Input2\": \"" << json_escape(info.dir2) << "\",\n";
  out << "  \"OutputDir\": \"" << json_escape(info.output_dir) << "\",\n";
  out << "  \"Extension\": \"" << json_escape(info.extension) << "\",\n";
  out << "  \"Range1\": ";
  write_range(info.range1);
  out << ",\n";
  out << "  \"Range2\": ";
  write_range(info.range2);
  out << ",\n";
  out << "  \"TotalBytesWritten\": " << info.total_bytes_written << ",\n";

  std::vector<std::string> rel_outputs;
  std::unordered_set<std::string> seen;
  for (const auto& o : info.outputs) {
    const std::string rel = relative_output(info.output_dir, o);
    if (seen.insert(rel).second) rel_outputs.push_back(rel);
  }

  out << "  \"Outputs\": [\n";
  for (size_t i = 0; i < rel_outputs.size(); ++i) {
    out << "    \"" << json_escape(rel_outputs[i]) << "\"";
    if (i + 1 < rel_outputs.size()) out << ",";
    out << "\n";
  }
  out << "  ]\n";
  out << "}\n";
  return write_text_file_atomic(json_path, out.str());
}

} // namespace npmerge
