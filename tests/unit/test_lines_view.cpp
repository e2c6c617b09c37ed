#include "file_lines/byte_source.hpp"
#include "file_lines/errors.hpp"
#include "file_lines/lines_view.hpp"
#include "test_sources.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

#define CHECK(cond) if(!(cond)) { std::cerr << "[FAIL] " << #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; return 1; }

static std::vector<std::string> split(const std::string& s, std::string_view sep) {
  std::vector<std::string> out;
  if (s.empty()) return out;
  std::size_t start = 0;
  while (true) {
    std::size_t pos = s.find(sep, start);
    if (pos == std::string::npos) { out.push_back(s.substr(start)); break; }
    out.push_back(s.substr(start, pos - start));
    start = pos + sep.size();
  }
  return out;
}

int main(){
  const fs::path f = "tests/data/lines.txt";
  const fs::path empty = "tests/data/empty.txt";
  if (!fs::exists(f) || !fs::exists(empty)) { std::cerr << "[ERR] missing fixtures\n"; return 2; }

  const std::vector<std::string> expected = {"alpha", "beta", "gamma", "", "delta"};

  // collect_all is stable no matter how many streams were opened before
  {
    fl::LinesView view(f.string());
    CHECK(view.collect_all() == expected);
    {
      auto s1 = view.stream();
      auto s2 = view.stream();
      CHECK(s1.take_next() == "alpha");
    }
    CHECK(view.collect_all() == expected);
    CHECK(!view.cached_count().has_value());
  }

  // collect_all reports the file bytes it consumed
  {
    fl::LinesView view(f.string());
    std::uint64_t bytes = 0;
    CHECK(view.collect_all(&bytes) == expected);
    CHECK(bytes == fs::file_size(f));
  }

  // count() is computed once; the second call does no I/O
  {
    fltest::Counters c;
    fl::ViewConfig cfg;
    cfg.path = f.string();
    cfg.chunk_bytes = 4;
    fl::LinesView view(cfg, [&c](const fl::ViewConfig& vc) -> std::unique_ptr<fl::ByteSource> {
      ++c.opens;
      return std::make_unique<fltest::CountingSource>(fl::open_source(vc), c);
    });

    CHECK(view.count() == 5);
    const int opens = c.opens.load();
    const int reads = c.reads.load();
    CHECK(opens == 1);
    CHECK(c.closes.load() == 1);
    CHECK(view.count() == 5);
    CHECK(c.opens.load() == opens);
    CHECK(c.reads.load() == reads);
    CHECK(view.cached_count() == std::optional<std::uint64_t>(5));
    CHECK(view.collect_all().size() == view.count());
    CHECK(!view.empty());
    CHECK(c.opens.load() == opens + 1);   // collect_all only; empty() used the cache
  }

  // empty file
  {
    fl::LinesView view(empty.string());
    auto s = view.stream();
    CHECK(!s.has_more());
    CHECK(s.is_closed());
    CHECK(view.count() == 0);
    CHECK(view.collect_all().empty());
    CHECK(view.render_all().empty());
    CHECK(view.empty());
    CHECK(!view.contains(""));
  }

  // independent streams over the same view
  {
    fl::LinesView view(f.string());
    auto a = view.stream();
    auto b = view.stream();
    CHECK(a.take_next() == "alpha");
    CHECK(a.take_next() == "beta");
    CHECK(b.take_next() == "alpha");
    CHECK(a.take_next() == "gamma");
    a.close();
    CHECK(b.take_next() == "beta");
    CHECK(!a.has_more());
    CHECK(b.has_more());
  }

  // render_all joins with the platform separator; split gives collect_all back
  {
    fl::LinesView view(f.string());
    std::string all = view.render_all();
    CHECK(all == "alpha" + std::string(fl::kLineSeparator) + "beta" + std::string(fl::kLineSeparator) +
                 "gamma" + std::string(fl::kLineSeparator) + std::string(fl::kLineSeparator) + "delta");
    CHECK(split(all, fl::kLineSeparator) == view.collect_all());
  }

  // contains / for_each
  {
    fl::LinesView view(f.string());
    CHECK(view.contains("gamma"));
    CHECK(view.contains(""));
    CHECK(!view.contains("omega"));
    std::vector<std::string> seen;
    const std::uint64_t n = view.for_each([&](std::string_view line){ seen.emplace_back(line); });
    CHECK(n == 5);
    CHECK(seen == expected);
  }

  // CRLF / CR terminators
  {
    fl::LinesView view(std::string("tests/data/crlf.txt"));
    CHECK((view.collect_all() == std::vector<std::string>{"one", "two", "three"}));
  }

  // open failures surface from every entry point; nothing gets cached
  {
    fl::LinesView view(std::string("tests/data/does-not-exist.txt"));
    int failures = 0;
    try { (void)view.stream(); } catch (const fl::OpenError&) { ++failures; }
    try { (void)view.count(); } catch (const fl::OpenError&) { ++failures; }
    try { (void)view.collect_all(); } catch (const fl::OpenError&) { ++failures; }
    try { (void)view.render_all(); } catch (const fl::OpenError&) { ++failures; }
    CHECK(failures == 4);
    CHECK(!view.cached_count().has_value());
  }

  // opener returning nothing is an open failure
  {
    fl::ViewConfig cfg;
    cfg.path = "unused";
    fl::LinesView view(cfg, [](const fl::ViewConfig&) { return std::unique_ptr<fl::ByteSource>(); });
    bool threw = false;
    try { (void)view.stream(); } catch (const fl::OpenError&) { threw = true; }
    CHECK(threw);
  }

  std::cout << "[PASS] lines_view\n";
  return 0;
}
