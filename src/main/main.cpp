#include "file_lines/errors.hpp"
#include "file_lines/line_digest.hpp"
#include "file_lines/lines_view.hpp"
#include "file_lines/metrics.hpp"
#include "file_lines/path_utils.hpp"
#include "file_lines/report_writer.hpp"
#include "file_lines/run_json.hpp"
#include "file_lines/view_config.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::string mode = "count";            // count|cat|collect
  std::optional<std::string> encoding;
  std::optional<bool> gzip;              // unset: guess from extension
  std::size_t chunk_bytes = 64 * 1024;
  std::size_t max_line_bytes = 0;
  std::string report_root;               // empty: no run.json
  std::string slug_mode = "hashprefix";  // hashprefix|basename
  int slug_len = 12;
  std::vector<fl::ViewConfig> views;     // from --config=
  std::vector<std::string> files;        // positional
};

[[noreturn]] void usage(int rc) {
  std::cout <<
    "Usage: file-lines [--mode=count|cat|collect] [--encoding=NAME]\n"
    "                  [--gzip|--no-gzip] [--chunk-bytes=N] [--max-line-bytes=N]\n"
    "                  [--config=view.json] [--report-root=DIR]\n"
    "                  [--slug-mode=hashprefix|basename] [--slug-len=N] FILE...\n";
  std::exit(rc);
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_n = [&](const char* pfx, std::size_t* out){
      if (a.rfind(pfx, 0) != 0) return false;
      const std::string num = a.substr(std::string(pfx).size());
      if (num.empty() || num[0] == '-' || num[0] == '+') {
        std::cerr << "[cli] expected a non-negative number: " << a << "\n";
        usage(2);
      }
      *out = std::stoull(num);
      return true;
    };
    std::string v;
    if (eat("--mode=", &c.mode)) continue;
    if (eat("--encoding=", &v)) { if (!v.empty()) c.encoding = v; continue; }
    if (a == "--gzip")    { c.gzip = true;  continue; }
    if (a == "--no-gzip") { c.gzip = false; continue; }
    if (eat_n("--chunk-bytes=", &c.chunk_bytes)) continue;
    if (eat_n("--max-line-bytes=", &c.max_line_bytes)) continue;
    if (eat("--config=", &v)) { c.views.push_back(fl::load_view_config(v)); continue; }
    if (eat("--report-root=", &c.report_root)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (a.rfind("--slug-len=", 0) == 0) { c.slug_len = std::stoi(a.substr(11)); continue; }
    if (a == "-h" || a == "--help") usage(0);
    if (a.rfind("--", 0) == 0) { std::cerr << "[cli] unknown option: " << a << "\n"; usage(2); }
    c.files.push_back(a);
  }
  if (c.mode != "count" && c.mode != "cat" && c.mode != "collect") {
    std::cerr << "[cli] unknown mode: " << c.mode << "\n";
    usage(2);
  }
  if (c.chunk_bytes == 0) { std::cerr << "[cli] --chunk-bytes must be > 0\n"; usage(2); }
  if (c.slug_len <= 0) { std::cerr << "[cli] --slug-len must be > 0\n"; usage(2); }
  return c;
}

fl::ViewConfig view_for(const Cli& cli, const std::string& path) {
  fl::ViewConfig v;
  v.path = path;
  v.encoding = cli.encoding;
  v.compressed = cli.gzip ? *cli.gzip : fl::looks_compressed(path);
  v.chunk_bytes = cli.chunk_bytes;
  v.max_line_bytes = cli.max_line_bytes;
  return v;
}

int run_one(const Cli& cli, fl::ViewConfig cfg) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  fl::LinesView view(std::move(cfg));
  fl::MetricsRegistry metrics;
  fl::LineDigest digest;

  metrics.start_stage("scan");
  if (cli.mode == "collect") {
    std::uint64_t bytes = 0;
    std::vector<std::string> lines = view.collect_all(&bytes);
    metrics.set_bytes(bytes);
    metrics.end_stage("scan");
    metrics.start_stage("digest");
    for (const auto& l : lines) { digest.add(l); metrics.add_line(l.size()); }
    metrics.end_stage("digest");
  } else {
    auto s = view.stream();
    for (const std::string& line : s) {
      digest.add(line);
      metrics.add_line(line.size());
      if (cli.mode == "cat") std::cout << line << fl::kLineSeparator;
    }
    metrics.set_bytes(s.bytes_read());
    s.close();
    metrics.end_stage("scan");
  }

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();
  fl::RunStats stats = metrics.snapshot(wall_ms);

  if (cli.mode == "count") {
    std::cout << stats.lines << "\t" << view.config().path << "\n";
  } else if (cli.mode == "collect") {
    std::cout << stats.lines << "\t" << stats.chars << "\t" << view.config().path << "\n";
  }

  if (cli.report_root.empty()) return 0;

  fl::RunJsonPayload p{};
  p.lines = stats.lines;
  p.bytes = stats.bytes;
  p.chars = stats.chars;
  p.wall_time_ms = stats.wall_time_ms;
  p.throughput_mb_s = stats.throughput_mb_s;
  p.lines_per_sec = stats.lines_per_sec;
  for (auto& st : stats.stages) p.stage_times.emplace_back(st.name, st.duration_ms);
  p.filename = view.config().path;
  p.encoding = view.config().encoding.value_or("");
  p.compressed = view.config().compressed;
  p.mode = cli.mode;
  p.digest = digest.hex();
  std::error_code fec;
  p.file_size = std::filesystem::file_size(view.config().path, fec);

  const std::string key = (cli.slug_mode == "hashprefix")
      ? std::filesystem::weakly_canonical(std::filesystem::path(view.config().path)).string()
      : view.config().path;
  const std::string slug = fl::make_slug(key, cli.slug_mode, cli.slug_len);

  std::string err;
  if (!fl::write_report_dir(cli.report_root, slug, fl::RunJsonWriter::to_json(p), &err)) {
    std::cerr << "[report] write_report_dir failed: " << err << "\n";
    return 2;
  }
  std::cerr << "[report] ok: " << view.config().path << " -> "
            << (std::filesystem::path(cli.report_root) / slug / "run.json").string() << "\n";
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    cli = parse_cli(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[cli] " << e.what() << "\n";
    return 2;
  }

  std::vector<fl::ViewConfig> inputs = cli.views;
  for (const auto& f : cli.files) inputs.push_back(view_for(cli, f));
  if (inputs.empty()) usage(2);

  int rc = 0;
  for (auto& cfg : inputs) {
    const std::string path = cfg.path;
    try {
      if (run_one(cli, std::move(cfg)) != 0) rc = 2;
    } catch (const fl::OpenError& e) {
      std::cerr << "[lines] open failed: " << e.what() << "\n";
      rc = 2;
    } catch (const fl::Error& e) {
      std::cerr << "[lines] " << path << ": " << e.what() << "\n";
      rc = 2;
    } catch (const std::exception& e) {
      std::cerr << "[lines] " << path << ": " << e.what() << "\n";
      rc = 2;
    }
  }
  return rc;
}
