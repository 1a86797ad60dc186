#include "npmerge/meta_file.hpp"

#include "npmerge/errors.hpp"

#include "test_support.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

int main() {
  using namespace npmerge;

  // 1) Parse keeps file order, splits on the first '=', tolerates CRLF and blanks.
  {
    std::istringstream is(
      "imSampRate=30000\r\n"
      "nSavedChans=385\r\n"
      "\r\n"
      "~snsChanMap=(384,384,1)(AP0;0:0)\r\n"
      "userNotes=a=b\r\n"
      "fileTimeSecs = 1.5 \r\n");
    const MetaRecord m = parse_meta(is, "inline.meta");
    assert(m.size() == 5);
    assert(m.entries()[0].first == "imSampRate");
    assert(m.entries()[2].first == "~snsChanMap");
    assert(m.get("userNotes") == "a=b");
    assert(m.get("fileTimeSecs") == "1.5");
    assert(m.get_int("nSavedChans") == 385);
    assert(m.get_double("imSampRate") == 30000.0);
    assert(m.source() == "inline.meta");
  }

  // 2) Malformed line: error names the source and the line number.
  {
    std::istringstream is("imSampRate=30000\nthis line has no separator\n");
    bool threw = false;
    try {
      (void)parse_meta(is, "bad.meta");
    } catch (const MetadataParseError& e) {
      threw = true;
      const std::string msg = e.what();
      assert(msg.find("bad.meta:2") != std::string::npos);
    }
    assert(threw);
  }

  {
    std::istringstream is("=value\n");
    bool threw = false;
    try {
      (void)parse_meta(is, "empty_key.meta");
    } catch (const MetadataParseError&) {
      threw = true;
    }
    assert(threw);
  }

  // 3) Missing or unparsable keys raise MetadataParseError.
  {
    std::istringstream is("nSavedChans=abc\n");
    const MetaRecord m = parse_meta(is, "x.meta");
    bool missing = false;
    try {
      (void)m.get("imSampRate");
    } catch (const MetadataParseError& e) {
      missing = std::string(e.what()).find("imSampRate") != std::string::npos;
    }
    assert(missing);

    bool bad_value = false;
    try {
      (void)m.get_int("nSavedChans");
    } catch (const MetadataParseError&) {
      bad_value = true;
    }
    assert(bad_value);
  }

  // 4) set() replaces in place and appends new keys at the end.
  {
    MetaRecord m;
    m.set("a", "1");
    m.set("b", "2");
    m.set("a", "3");
    m.set("c", "4");
    assert(format_meta(m) == "a=3\nb=2\nc=4\n");
    assert(m.has("b"));
    assert(!m.has("z"));
  }

  // 5) File round trip (BOM stripped on read, atomic write leaves no temp files).
  {
    const std::filesystem::path dir = npmerge_test::scratch_dir("npmerge_test_meta_file");
    const std::filesystem::path in_path = dir / "in.ap.meta";
    npmerge_test::write_text(in_path, "\xEF\xBB\xBFimSampRate=2500\nfirstSample=7\n");

    const MetaRecord m = read_meta_file(in_path.string());
    assert(m.get("imSampRate") == "2500");
    assert(m.get_int64("firstSample") == 7);

    const std::filesystem::path out_path = dir / "sub" / "out.ap.meta";
    write_meta_file(out_path.string(), m);
    assert(npmerge_test::read_text(out_path) == "imSampRate=2500\nfirstSample=7\n");
    assert(npmerge_test::count_entries_containing(dir / "sub", ".tmp.") == 0);

    bool threw = false;
    try {
      (void)read_meta_file((dir / "missing.meta").string());
    } catch (const IoError&) {
      threw = true;
    }
    assert(threw);

#if !defined(_WIN32)
    // A rename that fails (here: destination is a directory) leaves the
    // destination in place and reports the error.
    const std::filesystem::path occupied = dir / "occupied.ap.meta";
    std::filesystem::create_directories(occupied);
    threw = false;
    try {
      write_meta_file(occupied.string(), m);
    } catch (const IoError&) {
      threw = true;
    }
    assert(threw);
    assert(std::filesystem::is_directory(occupied));
    assert(npmerge_test::count_entries_containing(dir, ".tmp.") == 0);
#endif

    std::filesystem::remove_all(dir);
  }

  // 6) Sidecar naming.
  {
    assert(meta_extension_for("ap.bin") == "ap.meta");
    assert(meta_extension_for("lf.bin") == "lf.meta");
    assert(meta_extension_for("bin") == "meta");
    assert(meta_extension_for("dat") == "dat");

    assert(meta_path_for("/d/run_g0_t0.imec0.ap.bin", "ap.bin") == "/d/run_g0_t0.imec0.ap.meta");
    assert(meta_path_for("run.bin", "bin") == "run.meta");

    bool threw = false;
    try {
      (void)meta_path_for("/d/run.lf.bin", "ap.bin");
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "ok\n";
  return 0;
}
