#pragma once
#include "file_lines/line_stream.hpp"
#include "file_lines/view_config.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fl {

class ByteSource;

#if defined(_WIN32)
inline constexpr std::string_view kLineSeparator = "\r\n";
#else
inline constexpr std::string_view kLineSeparator = "\n";
#endif

// The lines of a (possibly gzip-compressed) text file, seen as a collection.
//
// Every stream() opens the file again and yields lines from the start, so a
// view can be iterated any number of times, from several threads at once.
// Nothing is materialized unless collect_all() is asked for.
//
// count() scans the whole file the first time and caches the result; the
// cache is the only state shared between streams.
class LinesView {
public:
  // Builds the byte chain for a stream; open_source() unless replaced.
  using SourceOpener = std::function<std::unique_ptr<ByteSource>(const ViewConfig&)>;
  using LineCallback = std::function<void(std::string_view)>;

  explicit LinesView(ViewConfig cfg);
  LinesView(ViewConfig cfg, SourceOpener opener);
  explicit LinesView(std::string path,
                     std::optional<std::string> encoding = std::nullopt,
                     bool compressed = false);

  LinesView(const LinesView&) = delete;
  LinesView& operator=(const LinesView&) = delete;

  const ViewConfig& config() const noexcept { return cfg_; }

  // Fresh, independent session. Throws OpenError.
  LineStream stream() const;

  // Number of lines. Full scan on first call, cached afterwards; concurrent
  // first callers wait for a single scan.
  std::uint64_t count() const;
  std::optional<std::uint64_t> cached_count() const;

  // Independent copies of every line, in file order. `bytes_read`, when
  // given, receives the bytes consumed from the file.
  std::vector<std::string> collect_all(std::uint64_t* bytes_read = nullptr) const;

  // Lines joined by kLineSeparator (none after the last).
  std::string render_all() const;

  // Full scan; stops at the first equal line.
  bool contains(std::string_view line) const;

  bool empty() const;

  // Scoped iteration; returns the number of lines visited.
  std::uint64_t for_each(const LineCallback& cb) const;

private:
  ViewConfig cfg_;
  SourceOpener opener_;
  mutable std::mutex count_mu_;
  mutable std::optional<std::uint64_t> count_;
};

}
