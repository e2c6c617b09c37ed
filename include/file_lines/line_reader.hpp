#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace fl {

class ByteSource;

// Buffered line splitter over a ByteSource. Terminators: "\n", "\r\n", "\r".
class LineReader {
public:
  struct Config {
    std::size_t chunk_bytes    = 64 * 1024; // read granularity
    std::size_t max_line_bytes = 0;         // 0 = unlimited, else ReadError past it
  };

  explicit LineReader(std::unique_ptr<ByteSource> src);  // uses default Config{}
  LineReader(std::unique_ptr<ByteSource> src, Config cfg);
  ~LineReader();

  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  // Overwrite `out` with the next line, terminator excluded.
  // Returns false at end of stream (or once closed). Throws ReadError.
  bool read_line(std::string& out);

  // Release the source. Idempotent; throws CloseError but stays closed.
  void close();

  bool is_closed() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
