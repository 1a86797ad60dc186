#include "npmerge/meta_file.hpp"

#include "npmerge/errors.hpp"
#include "npmerge/utils.hpp"

#include <filesystem>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>

namespace npmerge {

bool MetaRecord::has(const std::string& key) const {
  for (const auto& e : entries_) {
    if (e.first == key) return true;
  }
  return false;
}

const std::string& MetaRecord::get(const std::string& key) const {
  for (const auto& e : entries_) {
    if (e.first == key) return e.second;
  }
  const std::string where = source_.empty() ? std::string("metadata") : source_;
  throw MetadataParseError(where + ": missing required key '" + key + "'");
}

void MetaRecord::set(const std::string& key, const std::string& value) {
  for (auto& e : entries_) {
    if (e.first == key) {
      e.second = value;
      return;
    }
  }
  entries_.emplace_back(key, value);
}

int64_t MetaRecord::get_int64(const std::string& key) const {
  const std::string& v = get(key);
  try {
    return to_int64(v);
  } catch (const std::exception& e) {
    throw MetadataParseError(source_ + ": key '" + key + "': " + e.what());
  }
}

int MetaRecord::get_int(const std::string& key) const {
  const std::string& v = get(key);
  try {
    return to_int(v);
  } catch (const std::exception& e) {
    throw MetadataParseError(source_ + ": key '" + key + "': " + e.what());
  }
}

double MetaRecord::get_double(const std::string& key) const {
  const std::string& v = get(key);
  try {
    return to_double(v);
  } catch (const std::exception& e) {
    throw MetadataParseError(source_ + ": key '" + key + "': " + e.what());
  }
}

MetaRecord parse_meta(std::istream& is, const std::string& source_label) {
  MetaRecord meta;
  meta.set_source(source_label);

  std::string line;
  size_t line_no = 0;
  while (std::getline(is, line)) {
    ++line_no;
    if (line_no == 1) line = strip_utf8_bom(line);

    const std::string t = trim(line);
    if (t.empty()) continue;

    const size_t eq = t.find('=');
    if (eq == std::string::npos) {
      throw MetadataParseError(source_label + ":" + std::to_string(line_no) +
                               ": expected key=value, got '" + t + "'");
    }

    const std::string key = trim(t.substr(0, eq));
    if (key.empty()) {
      throw MetadataParseError(source_label + ":" + std::to_string(line_no) +
                               ": empty key");
    }
    meta.set(key, trim(t.substr(eq + 1)));
  }

  if (is.bad()) {
    throw IoError("Failed while reading metadata: " + source_label);
  }
  return meta;
}

MetaRecord read_meta_file(const std::string& path) {
  std::ifstream is(std::filesystem::u8path(path), std::ios::binary);
  if (!is) {
    throw IoError("Failed to open metadata file: " + path);
  }
  return parse_meta(is, path);
}

std::string format_meta(const MetaRecord& meta) {
  std::ostringstream oss;
  for (const auto& e : meta.entries()) {
    oss << e.first << '=' << e.second << '\n';
  }
  return oss.str();
}

void write_meta_file(const std::string& path, const MetaRecord& meta) {
  if (!write_text_file_atomic(path, format_meta(meta))) {
    throw IoError("Failed to write metadata file: " + path);
  }
}

std::string meta_extension_for(const std::string& bin_extension) {
  if (bin_extension == "bin") return "meta";
  if (ends_with(bin_extension, ".bin")) {
    return bin_extension.substr(0, bin_extension.size() - 4) + ".meta";
  }
  return bin_extension;
}

std::string meta_path_for(const std::string& bin_path, const std::string& bin_extension) {
  const std::string suffix = "." + bin_extension;
  if (!ends_with(bin_path, suffix)) {
    throw std::invalid_argument("meta_path_for: '" + bin_path + "' does not end with '" +
                                suffix + "'");
  }
  return bin_path.substr(0, bin_path.size() - suffix.size()) + "." +
         meta_extension_for(bin_extension);
}

} // namespace npmerge
