#include "file_lines/lines_view.hpp"
#include "file_lines/byte_source.hpp"
#include "file_lines/errors.hpp"
#include "file_lines/line_reader.hpp"

#include <utility>

namespace fl {

LinesView::LinesView(ViewConfig cfg)
  : LinesView(std::move(cfg), SourceOpener(open_source)) {}

LinesView::LinesView(ViewConfig cfg, SourceOpener opener)
  : cfg_(std::move(cfg)), opener_(std::move(opener)) {}

LinesView::LinesView(std::string path, std::optional<std::string> encoding, bool compressed)
  : LinesView(ViewConfig{std::move(path), std::move(encoding), compressed}) {}

LineStream LinesView::stream() const {
  std::unique_ptr<ByteSource> src = opener_(cfg_);
  if (!src) throw OpenError(cfg_.path, 0, "no byte source for " + cfg_.path);

  LineReader::Config rcfg;
  rcfg.chunk_bytes    = cfg_.chunk_bytes;
  rcfg.max_line_bytes = cfg_.max_line_bytes;
  return LineStream(std::make_unique<LineReader>(std::move(src), rcfg));
}

std::uint64_t LinesView::count() const {
  std::lock_guard<std::mutex> lk(count_mu_);
  if (count_) return *count_;

  std::uint64_t n = 0;
  LineStream s = stream();
  while (s.has_more()) {
    (void)s.borrow_next();
    ++n;
  }
  s.close();
  count_ = n;
  return n;
}

std::optional<std::uint64_t> LinesView::cached_count() const {
  std::lock_guard<std::mutex> lk(count_mu_);
  return count_;
}

std::vector<std::string> LinesView::collect_all(std::uint64_t* bytes_read) const {
  std::vector<std::string> lines;
  if (auto n = cached_count()) lines.reserve(static_cast<std::size_t>(*n));

  LineStream s = stream();
  while (s.has_more()) lines.emplace_back(s.borrow_next());
  s.close();
  if (bytes_read) *bytes_read = s.bytes_read();
  return lines;
}

std::string LinesView::render_all() const {
  std::string out;
  bool first = true;
  LineStream s = stream();
  while (s.has_more()) {
    if (!first) out.append(kLineSeparator);
    out.append(s.borrow_next());
    first = false;
  }
  s.close();
  return out;
}

bool LinesView::contains(std::string_view line) const {
  LineStream s = stream();
  while (s.has_more()) {
    if (s.borrow_next() == line) {
      s.close();
      return true;
    }
  }
  return false;
}

bool LinesView::empty() const {
  if (auto n = cached_count()) return *n == 0;
  LineStream s = stream();
  const bool more = s.has_more();
  s.close();
  return !more;
}

std::uint64_t LinesView::for_each(const LineCallback& cb) const {
  std::uint64_t n = 0;
  LineStream s = stream();
  while (s.has_more()) {
    cb(s.borrow_next());
    ++n;
  }
  s.close();
  return n;
}

}
