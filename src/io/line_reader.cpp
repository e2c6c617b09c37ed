#include "file_lines/line_reader.hpp"
#include "file_lines/byte_source.hpp"
#include "file_lines/errors.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace fl {

struct LineReader::Impl {
  std::unique_ptr<ByteSource> src;
  Config cfg;
  std::vector<char> buf;
  std::size_t pos{0};
  std::size_t len{0};
  bool eof{false};
  bool skip_lf{false};   // last line ended in '\r'; swallow a following '\n'
  std::uint64_t lines{0};
  std::uint64_t bytes_at_close{0};

  Impl(std::unique_ptr<ByteSource> s, Config c)
    : src(std::move(s)), cfg(c), buf(std::max<std::size_t>(c.chunk_bytes, 1)) {}

  bool refill() {
    if (eof || !src) return false;
    len = src->read(buf.data(), buf.size());
    pos = 0;
    if (len == 0) eof = true;
    return len > 0;
  }

  void append_guarded(std::string& out, const char* b, const char* e) {
    const std::size_t n = static_cast<std::size_t>(e - b);
    if (cfg.max_line_bytes && out.size() + n > cfg.max_line_bytes)
      throw ReadError("line " + std::to_string(lines + 1) + " exceeds max_line_bytes (" +
                      std::to_string(cfg.max_line_bytes) + ")");
    out.append(b, n);
  }

  bool read_line(std::string& out) {
    out.clear();
    bool have_line = false; // saw at least one char of the current line

    while (true) {
      if (pos == len && !refill()) {
        if (have_line) { ++lines; return true; }
        return false;
      }

      if (skip_lf) {
        skip_lf = false;
        if (buf[pos] == '\n') { ++pos; continue; }
      }

      const char* b = buf.data() + pos;
      const char* e = buf.data() + len;
      const char* t = std::find_if(b, e, [](char c){ return c == '\n' || c == '\r'; });

      if (t != b) { append_guarded(out, b, t); have_line = true; }
      if (t == e) { pos = len; continue; } // line continues in the next chunk

      skip_lf = (*t == '\r');
      pos = static_cast<std::size_t>(t - buf.data()) + 1;
      ++lines;
      return true;
    }
  }

  void close() {
    if (!src) return;
    std::unique_ptr<ByteSource> s = std::move(src);
    bytes_at_close = s->bytes_read();
    pos = len = 0;
    s->close();
  }
};

LineReader::LineReader(std::unique_ptr<ByteSource> src)
  : LineReader(std::move(src), Config{}) {}

LineReader::LineReader(std::unique_ptr<ByteSource> src, Config cfg)
  : p_(new Impl(std::move(src), cfg)) {}

LineReader::~LineReader() { delete p_; }

bool LineReader::read_line(std::string& out) { return p_->read_line(out); }
void LineReader::close() { p_->close(); }
bool LineReader::is_closed() const noexcept { return !p_->src; }
std::uint64_t LineReader::bytes_read() const noexcept {
  return p_->src ? p_->src->bytes_read() : p_->bytes_at_close;
}
std::uint64_t LineReader::lines_read() const noexcept { return p_->lines; }

}
