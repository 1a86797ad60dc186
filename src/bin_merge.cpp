#include "npmerge/bin_merge.hpp"

#include "npmerge/errors.hpp"
#include "npmerge/meta_file.hpp"
#include "npmerge/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace npmerge {

ByteRange resolve_input_range(const BinMergeInput& input) {
  std::error_code ec;
  const uintmax_t size = std::filesystem::file_size(std::filesystem::u8path(input.path), ec);
  if (ec) {
    throw IoError("Failed to stat input file: " + input.path + " (" + ec.message() + ")");
  }

  ByteRange full;
  full.begin = 0;
  full.end = static_cast<uint64_t>(size);

  if (!input.range) return full;

  if (input.meta_path.empty()) {
    throw std::invalid_argument("A time range was given for " + input.path +
                                " without its metadata file");
  }
  const MetaRecord meta = read_meta_file(input.meta_path);
  return clamp_byte_range(time_range_to_byte_range(*input.range, meta), full.end);
}

uint64_t copy_byte_range(std::istream& in,
                         std::ostream& out,
                         uint64_t begin,
                         uint64_t count,
                         size_t chunk_bytes,
                         const std::function<void(uint64_t)>& on_chunk,
                         const std::string& label) {
  if (chunk_bytes == 0) {
    throw std::invalid_argument("copy_byte_range: chunk_bytes must be > 0");
  }
  if (count == 0) return 0;

  in.seekg(static_cast<std::streamoff>(begin), std::ios::beg);
  if (!in) {
    throw IoError("Failed to seek to byte " + std::to_string(begin) + " in " + label);
  }

  const size_t buf_size = static_cast<size_t>(std::min<uint64_t>(chunk_bytes, count));
  std::vector<char> buf(buf_size);

  uint64_t done = 0;
  while (done < count) {
    const size_t n = static_cast<size_t>(std::min<uint64_t>(buf_size, count - done));
    in.read(buf.data(), static_cast<std::streamsize>(n));
    if (static_cast<size_t>(in.gcount()) != n) {
      throw IoError("Short read from " + label + " at byte " + std::to_string(begin + done) +
                    " (wanted " + std::to_string(n) + ", got " +
                    std::to_string(in.gcount()) + ")");
    }

    out.write(buf.data(), static_cast<std::streamsize>(n));
    if (!out) {
      throw IoError("Write failed while copying from " + label);
    }

    done += n;
    if (on_chunk) on_chunk(done);
  }

  return done;
}

static void rename_into_place(const std::filesystem::path& tmp, const std::filesystem::path& target) {
  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
#if defined(_WIN32)
  // Windows: rename may fail if the destination exists.
  std::error_code rm_ec;
  if (ec && std::filesystem::is_regular_file(target, rm_ec)) {
    std::filesystem::remove(target, rm_ec);
    ec.clear();
    std::filesystem::rename(tmp, target, ec);
  }
#endif
  if (ec) {
    throw IoError("Failed to move " + tmp.u8string() + " to " + target.u8string() + " (" +
                  ec.message() + ")");
  }
}

uint64_t merge_bin_files(const BinMergeInput& first,
                         const BinMergeInput& second,
                         const std::string& output_path,
                         const BinMergeOptions& opt) {
  const ByteRange r1 = resolve_input_range(first);
  const ByteRange r2 = resolve_input_range(second);
  const uint64_t total = r1.size() + r2.size();

  const std::filesystem::path target = std::filesystem::u8path(output_path);
  if (target.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      throw IoError("Failed to create output directory " + target.parent_path().u8string() +
                    " (" + ec.message() + ")");
    }
  }

  const std::filesystem::path tmp = std::filesystem::u8path(make_temp_path_beside(output_path));

  try {
    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out) throw IoError("Failed to open output file: " + tmp.u8string());

      uint64_t written = 0;
      auto copy_one = [&](const BinMergeInput& input, const ByteRange& r) {
        std::ifstream in(std::filesystem::u8path(input.path), std::ios::binary);
        if (!in) throw IoError("Failed to open input file: " + input.path);

        const size_t chunk = input.range ? opt.range_chunk_bytes : opt.whole_file_chunk_bytes;
        const uint64_t base = written;
        written += copy_byte_range(in, out, r.begin, r.size(), chunk,
                                   [&](uint64_t done) {
                                     if (opt.progress) opt.progress(base + done, total);
                                   },
                                   input.path);
      };

      copy_one(first, r1);
      copy_one(second, r2);

      out.flush();
      out.close();
      if (!out) throw IoError("Failed to finish writing " + tmp.u8string());
      if (written != total) {
        throw IoError("Wrote " + std::to_string(written) + " bytes to " + output_path +
                      ", expected " + std::to_string(total));
      }
    }

    rename_into_place(tmp, target);
  } catch (...) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
    throw;
  }

  return total;
}

} // namespace npmerge
