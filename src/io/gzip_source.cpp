#include "file_lines/byte_source.hpp"
#include "file_lines/errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <limits>
#include <system_error>
#include <utility>
#include <vector>

namespace fl {

namespace {

constexpr std::size_t kInflateInputBytes = 64 * 1024;
constexpr unsigned char kGzipMagic0 = 0x1f;
constexpr unsigned char kGzipMagic1 = 0x8b;
constexpr int kGzipWindowBits = 15 + 16; // zlib: expect a gzip wrapper
constexpr std::size_t kGzipHeaderBytes = 10;
constexpr unsigned char kGzipReservedFlags = 0xe0;

class GzipByteSource final : public ByteSource {
public:
  GzipByteSource(std::string path, std::FILE* f)
    : path_(std::move(path)), f_(f), in_(kInflateInputBytes) {
    std::memset(&zs_, 0, sizeof(zs_));
  }

  ~GzipByteSource() override {
    if (zs_open_) inflateEnd(&zs_);
    if (f_) std::fclose(f_);
  }

  // Validate the fixed header (magic, deflate method, no reserved flags)
  // and set up the inflater. Throws OpenError.
  void start() {
    fill_input();
    if (zs_.avail_in < kGzipHeaderBytes || in_[0] != kGzipMagic0 || in_[1] != kGzipMagic1)
      throw OpenError(path_, 0, "not in gzip format: " + path_);
    if (in_[2] != Z_DEFLATED)
      throw OpenError(path_, 0, "unknown gzip compression method: " + path_);
    if ((in_[3] & kGzipReservedFlags) != 0)
      throw OpenError(path_, 0, "reserved gzip header flags set: " + path_);
    if (inflateInit2(&zs_, kGzipWindowBits) != Z_OK)
      throw OpenError(path_, 0, "inflateInit2 failed: " + path_);
    zs_open_ = true;
  }

  std::size_t read(char* dst, std::size_t n) override {
    if (!f_ || done_ || n == 0) return 0;
    // avail_out is a uInt; larger requests are served in part.
    const std::size_t want = std::min<std::size_t>(n, std::numeric_limits<uInt>::max());
    zs_.next_out  = reinterpret_cast<Bytef*>(dst);
    zs_.avail_out = static_cast<uInt>(want);

    while (zs_.avail_out > 0 && !done_) {
      if (zs_.avail_in == 0) {
        fill_input();
        if (zs_.avail_in == 0) {
          if (in_member_) throw ReadError("unexpected end of gzip stream: " + path_);
          done_ = true;
          break;
        }
      }

      const int ret = inflate(&zs_, Z_NO_FLUSH);
      if (ret == Z_STREAM_END) {
        in_member_ = false;
        next_member();
      } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
        throw ReadError(std::string("inflate failed: ") + path_ + ": " +
                        (zs_.msg ? zs_.msg : zError(ret)));
      }
    }
    return want - zs_.avail_out;
  }

  void close() override {
    if (!f_) return;
    if (zs_open_) { inflateEnd(&zs_); zs_open_ = false; }
    std::FILE* f = f_;
    f_ = nullptr;
    if (std::fclose(f) != 0)
      throw CloseError("close failed: " + path_ + ": " + std::system_category().message(errno));
  }

  std::uint64_t bytes_read() const noexcept override { return bytes_; }

private:
  void fill_input() {
    std::size_t got = std::fread(in_.data(), 1, in_.size(), f_);
    if (got == 0 && std::ferror(f_))
      throw ReadError("read failed: " + path_ + ": " + std::system_category().message(errno));
    bytes_ += got;
    zs_.next_in  = in_.data();
    zs_.avail_in = static_cast<uInt>(got);
  }

  // Another member may follow; trailing bytes without gzip magic are ignored.
  void next_member() {
    if (zs_.avail_in == 0) fill_input();
    if (zs_.avail_in == 0 || zs_.next_in[0] != kGzipMagic0) { done_ = true; return; }
    if (inflateReset(&zs_) != Z_OK) throw ReadError("inflateReset failed: " + path_);
    in_member_ = true;
  }

  std::string path_;
  std::FILE* f_;
  std::vector<unsigned char> in_;
  z_stream zs_;
  bool zs_open_{false};
  bool in_member_{true};
  bool done_{false};
  std::uint64_t bytes_{0};
};

}

std::unique_ptr<ByteSource> open_gzip_source(const std::string& path) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    const int err = errno;
    throw OpenError(path, err, "cannot open: " + path + ": " + std::system_category().message(err));
  }
  auto src = std::make_unique<GzipByteSource>(path, f);
  src->start();
  return src;
}

}
