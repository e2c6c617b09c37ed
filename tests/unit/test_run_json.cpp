#include "file_lines/line_digest.hpp"
#include "file_lines/metrics.hpp"
#include "file_lines/path_utils.hpp"
#include "file_lines/report_writer.hpp"
#include "file_lines/run_json.hpp"

#include <simdjson.h>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

#define CHECK(cond) if(!(cond)) { std::cerr << "[FAIL] " << #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; return 1; }

int main(){
  // digests of known line sequences
  {
    fl::LineDigest d;
    CHECK(d.hex() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  }
  {
    fl::LineDigest d;
    d.add("a");
    d.add("b");
    CHECK(d.lines() == 2);
    const std::string h = d.hex();
    CHECK(h == "911169ddaaf146aff539f58c26c489af3b892dff0fe283c1c264c65ae5aa59a2");
    CHECK(d.hex() == h);
  }

  // slugs
  CHECK(fl::make_slug("/data/in/file.txt", "basename", 64) == "file.txt");
  CHECK(fl::make_slug("/data/in/file.txt", "basename", 4) == "file");
  CHECK(fl::make_slug("/data/in/file.txt", "hashprefix", 12).size() == 12);
  CHECK(fl::make_slug("k", "hashprefix", 8) == fl::hex_hash_prefix("k", 8));
  CHECK(fl::make_slug("k", "hashprefix", 0).empty());
  CHECK(fl::make_slug("k", "hashprefix", -1).empty());
  CHECK(fl::make_slug("/data/in/file.txt", "basename", -1).empty());
  CHECK(fl::hex_hash_prefix("k", -5).empty());

  // metrics keep stage order
  fl::MetricsRegistry m;
  m.start_stage("scan");
  m.add_line(5);
  m.add_line(0);
  m.set_bytes(2048);
  m.end_stage("scan");
  m.start_stage("digest");
  m.end_stage("digest");
  m.end_stage("never-started");
  fl::RunStats st = m.snapshot(1000.0);
  CHECK(st.lines == 2);
  CHECK(st.chars == 5);
  CHECK(st.lines_per_sec == 2.0);
  CHECK(st.stages.size() == 2);
  CHECK(st.stages[0].name == "scan");
  CHECK(st.stages[1].name == "digest");

  // payload -> JSON -> simdjson
  fl::RunJsonPayload p{};
  p.lines = st.lines;
  p.bytes = 2048;
  p.wall_time_ms = 1000.0;
  p.filename = "dir/we\"ird\tname.txt";
  p.compressed = true;
  p.mode = "count";
  p.digest = "abc";
  for (auto& s : st.stages) p.stage_times.emplace_back(s.name, s.duration_ms);
  const std::string json = fl::RunJsonWriter::to_json(p);

  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);
  auto doc = parser.iterate(padded);
  CHECK(doc["lines"].get_uint64().value() == 2);
  CHECK(doc["bytes"].get_uint64().value() == 2048);
  auto stages = doc["stage_times"].get_array();
  std::size_t n_stages = 0;
  for (auto s : stages) { (void)s; ++n_stages; }
  CHECK(n_stages == 2);
  std::string_view fname = doc["filename"].get_string().value();
  CHECK(fname == "dir/we\"ird\tname.txt");
  CHECK(bool(doc["encoding"].is_null()));
  CHECK(doc["compressed"].get_bool().value());
  CHECK(doc["digest"].get_string().value() == "abc");

  // report dir
  const fs::path root = fs::temp_directory_path() / "file_lines_report_test";
  fs::remove_all(root);
  std::string err;
  CHECK(fl::write_report_dir(root.string(), "slug", json, &err));
  CHECK(fs::file_size(root / "slug" / "run.json") == json.size());
  fs::remove_all(root);

  std::cout << "[PASS] run_json\n";
  return 0;
}
