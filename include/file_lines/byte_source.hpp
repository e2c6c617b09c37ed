#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace fl {

struct ViewConfig;

// Pull-based producer of raw (or decompressed / transcoded) bytes.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Fill up to n bytes; returns 0 only at end of stream. Throws ReadError.
  virtual std::size_t read(char* dst, std::size_t n) = 0;

  // Release the underlying handle. Idempotent. Throws CloseError.
  virtual void close() = 0;

  // Bytes consumed from the file itself (compressed bytes for gzip).
  virtual std::uint64_t bytes_read() const noexcept = 0;
};

// Plain file through stdio. Throws OpenError.
std::unique_ptr<ByteSource> open_file_source(const std::string& path);

// gzip file (concatenated members allowed) through zlib inflate.
// Throws OpenError when the file is missing or has no gzip magic.
std::unique_ptr<ByteSource> open_gzip_source(const std::string& path);

// Transcode `inner` from `encoding` to UTF-8 with iconv. Invalid sequences
// become U+FFFD. Throws OpenError for an encoding iconv does not know.
std::unique_ptr<ByteSource> decode_source(std::unique_ptr<ByteSource> inner,
                                          const std::string& encoding,
                                          const std::string& path);

// file -> [gzip] -> [decoder], as configured.
std::unique_ptr<ByteSource> open_source(const ViewConfig& cfg);

}
