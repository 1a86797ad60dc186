#include "npmerge/utils.hpp"

#include <cctype>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <random>
#include <sstream>
#include <stdexcept>

namespace npmerge {

static inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && is_space(s[b])) ++b;
  size_t e = s.size();
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string strip_utf8_bom(std::string s) {
  // UTF-8 BOM bytes: EF BB BF
  if (s.size() >= 3) {
    const unsigned char b0 = static_cast<unsigned char>(s[0]);
    const unsigned char b1 = static_cast<unsigned char>(s[1]);
    const unsigned char b2 = static_cast<unsigned char>(s[2]);
    if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) {
      return s.substr(3);
    }
  }
  return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    out.push_back(item);
  }
  // Handle trailing empty field
  if (!s.empty() && s.back() == delim) out.emplace_back("");
  return out;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int to_int(const std::string& s) {
  const int64_t v = to_int64(s);
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    throw std::runtime_error("Failed to parse int from '" + s + "': out of range");
  }
  return static_cast<int>(v);
}

int64_t to_int64(const std::string& s) {
  try {
    const std::string t = trim(s);
    size_t idx = 0;
    const long long v = std::stoll(t, &idx, 10);
    if (idx == 0) throw std::invalid_argument("no digits");
    // Be strict: reject trailing garbage like "12abc".
    if (idx != t.size()) throw std::invalid_argument("trailing characters");
    return static_cast<int64_t>(v);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse integer from '" + s + "': " + e.what());
  }
}

namespace {

static bool parse_double_classic(const std::string& x, double* out) {
  if (!out) return false;
  std::istringstream iss(x);
  iss.imbue(std::locale::classic());
  double v = 0.0;
  iss >> v;
  if (!iss) return false;
  // Allow trailing whitespace, but reject any other trailing characters.
  iss >> std::ws;
  if (!iss.eof()) return false;
  *out = v;
  return true;
}

} // namespace

double to_double(const std::string& s) {
  const std::string t = trim(s);
  double v = 0.0;
  if (t.empty() || !parse_double_classic(t, &v)) {
    throw std::runtime_error("Failed to parse double from '" + s + "'");
  }
  return v;
}

std::string format_double(double v) {
  if (std::isnan(v)) return "nan";
  if (std::isinf(v)) return v < 0.0 ? "-inf" : "inf";

  // Shortest precision that survives a round trip.
  std::string s;
  for (int prec = 1; prec <= std::numeric_limits<double>::max_digits10; ++prec) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(prec) << v;
    s = oss.str();
    double back = 0.0;
    if (parse_double_classic(s, &back) && back == v) break;
  }

  if (s.find_first_of(".eE") == std::string::npos) s += ".0";
  return s;
}

void ensure_directory(const std::string& path) {
  std::filesystem::create_directories(std::filesystem::u8path(path));
}

std::string random_hex_token(size_t n_bytes) {
  if (n_bytes == 0) n_bytes = 16;
  static const char* kHex = "0123456789abcdef";

  std::random_device rd;

  std::string out;
  out.reserve(n_bytes * 2);

  size_t produced = 0;
  while (produced < n_bytes) {
    const std::random_device::result_type r = rd();
    for (size_t k = 0; k < sizeof(r) && produced < n_bytes; ++k) {
      const unsigned char b = static_cast<unsigned char>((r >> (8 * k)) & 0xFFu);
      out.push_back(kHex[(b >> 4) & 0x0F]);
      out.push_back(kHex[b & 0x0F]);
      ++produced;
    }
  }

  return out;
}

std::string make_temp_path_beside(const std::string& path) {
  const std::filesystem::path target = std::filesystem::u8path(path);
  const std::filesystem::path dir = target.has_parent_path() ? target.parent_path()
                                                             : std::filesystem::path();
  const std::string base = target.filename().u8string();

  std::error_code ec;
  std::filesystem::path tmp;
  for (int attempt = 0; attempt < 10; ++attempt) {
    const std::string name = base + ".tmp." + random_hex_token(8);
    tmp = dir.empty() ? std::filesystem::u8path(name) : (dir / std::filesystem::u8path(name));
    if (!std::filesystem::exists(tmp, ec)) break;
  }
  return tmp.u8string();
}

bool write_text_file_atomic(const std::string& path, const std::string& content) {
  const std::filesystem::path target = std::filesystem::u8path(path);

  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
  }

  const std::filesystem::path tmp = std::filesystem::u8path(make_temp_path_beside(path));

  {
    std::ofstream out(tmp, std::ios::binary);
    if (!out) return false;
    if (!content.empty()) out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    out.close();
    if (!out) {
      std::error_code rm_ec;
      std::filesystem::remove(tmp, rm_ec);
      return false;
    }
  }

  ec.clear();
  std::filesystem::rename(tmp, target, ec);
#if defined(_WIN32)
  // Windows: rename may fail if the destination exists.
  std::error_code st_ec;
  if (ec && std::filesystem::is_regular_file(target, st_ec)) {
    std::filesystem::remove(target, st_ec);
    ec.clear();
    std::filesystem::rename(tmp, target, ec);
  }
#endif

  if (ec) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
    return false;
  }

  return true;
}

namespace {

static bool localtime_safe(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return out && localtime_s(out, &t) == 0;
#else
  return out && localtime_r(&t, out) != nullptr;
#endif
}

static bool gmtime_safe(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return out && gmtime_s(out, &t) == 0;
#else
  return out && gmtime_r(&t, out) != nullptr;
#endif
}

static long utc_offset_seconds(std::time_t t) {
  std::tm local_tm{};
  std::tm gm_tm{};
  if (!localtime_safe(t, &local_tm) || !gmtime_safe(t, &gm_tm)) return 0;

  // mktime() interprets its input as local time, so converting both broken-down
  // times yields the local UTC offset (including DST) for this instant.
  std::tm gm_as_local = gm_tm;
  gm_as_local.tm_isdst = -1;

  const std::time_t local_tt = std::mktime(&local_tm);
  const std::time_t gm_local_tt = std::mktime(&gm_as_local);
  if (local_tt == (std::time_t)-1 || gm_local_tt == (std::time_t)-1) return 0;

  return static_cast<long>(std::difftime(local_tt, gm_local_tt));
}

static std::string format_utc_offset(long offset_seconds) {
  char sign = '+';
  if (offset_seconds < 0) {
    sign = '-';
    offset_seconds = -offset_seconds;
  }

  const long total_minutes = offset_seconds / 60;
  std::ostringstream oss;
  oss << sign
      << std::setw(2) << std::setfill('0') << (total_minutes / 60)
      << ":"
      << std::setw(2) << std::setfill('0') << (total_minutes % 60);
  return oss.str();
}

} // namespace

std::string now_string_local() {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  if (!localtime_safe(t, &tm)) return std::string();

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
      << format_utc_offset(utc_offset_seconds(t));
  return oss.str();
}

std::string now_string_utc() {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  if (!gmtime_safe(t, &tm)) return std::string();

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string json_escape(const std::string& s) {
  std::ostringstream oss;
  oss << std::hex << std::uppercase;
  for (unsigned char uc : s) {
    const char c = static_cast<char>(uc);
    switch (c) {
      case '"': oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (uc < 0x20) {
          oss << "\\u" << std::setw(4) << std::setfill('0') << static_cast<int>(uc);
          oss << std::setw(0) << std::setfill(' ');
        } else {
          oss << c;
        }
        break;
    }
  }
  return oss.str();
}

} // namespace npmerge
