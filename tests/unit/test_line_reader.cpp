#include "file_lines/byte_source.hpp"
#include "file_lines/errors.hpp"
#include "file_lines/line_reader.hpp"
#include "test_sources.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

#define CHECK(cond) if(!(cond)) { std::cerr << "[FAIL] " << #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; return 1; }

static std::vector<std::string> read_all(fl::LineReader& r) {
  std::vector<std::string> out;
  std::string line;
  while (r.read_line(line)) out.push_back(line);
  return out;
}

static std::vector<std::string> split_mem(const std::string& data, std::size_t step, std::size_t chunk) {
  fl::LineReader r(std::make_unique<fltest::StringSource>(data, step), fl::LineReader::Config{chunk, 0});
  return read_all(r);
}

int main(){
  const fs::path f = "tests/data/lines.txt";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }

  const std::vector<std::string> expected = {"alpha", "beta", "gamma", "", "delta"};

  // file, every chunk size from 1 byte up
  for (std::size_t chunk : {1, 2, 3, 5, 7, 64 * 1024}) {
    fl::LineReader r(fl::open_file_source(f.string()), fl::LineReader::Config{chunk, 0});
    auto got = read_all(r);
    if (got != expected) { std::cerr << "[FAIL] lines.txt with chunk=" << chunk << "\n"; return 1; }
    CHECK(r.lines_read() == 5);
    CHECK(r.bytes_read() == fs::file_size(f));
    std::string again = "stale";
    CHECK(!r.read_line(again));   // stays at end
    CHECK(again.empty());
  }

  // terminators: \n, \r\n, lone \r, including \r | \n split across reads
  for (std::size_t step : {1, 2, 3, 4096}) {
    CHECK((split_mem("one\r\ntwo\rthree\n", step, 4) == std::vector<std::string>{"one", "two", "three"}));
    CHECK((split_mem("a\r\r\nb", step, 2) == std::vector<std::string>{"a", "", "b"}));
    CHECK((split_mem("\n\n", step, 1) == std::vector<std::string>{"", ""}));
    CHECK((split_mem("x\r", step, 1) == std::vector<std::string>{"x"}));
  }
  CHECK(split_mem("", 1, 1).empty());

  // max_line_bytes guard
  {
    fl::LineReader r(std::make_unique<fltest::StringSource>("short\nmuch too long\n"),
                     fl::LineReader::Config{4, 8});
    std::string line;
    CHECK(r.read_line(line) && line == "short");
    bool threw = false;
    try { r.read_line(line); } catch (const fl::ReadError&) { threw = true; }
    CHECK(threw);
  }

  // closed reader reports end of stream, close is idempotent
  {
    fl::LineReader r(std::make_unique<fltest::StringSource>("a\nb\n"));
    std::string line;
    CHECK(r.read_line(line) && line == "a");
    r.close();
    r.close();
    CHECK(r.is_closed());
    CHECK(!r.read_line(line));
    CHECK(r.bytes_read() == 4);
  }

  // missing file
  {
    bool threw = false;
    try { (void)fl::open_file_source("tests/data/does-not-exist.txt"); }
    catch (const fl::OpenError& e) { threw = e.error_code() != 0; }
    CHECK(threw);
  }

  std::cout << "[PASS] line_reader\n";
  return 0;
}
