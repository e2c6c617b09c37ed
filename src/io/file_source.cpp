#include "file_lines/byte_source.hpp"
#include "file_lines/errors.hpp"
#include "file_lines/view_config.hpp"

#include <cerrno>
#include <cstdio>
#include <system_error>
#include <utility>

namespace fl {

namespace {

std::string with_errno(const std::string& what, const std::string& path, int err) {
  return what + ": " + path + ": " + std::system_category().message(err);
}

class FileByteSource final : public ByteSource {
public:
  FileByteSource(std::string path, std::FILE* f) : path_(std::move(path)), f_(f) {}

  ~FileByteSource() override {
    if (f_) std::fclose(f_);
  }

  std::size_t read(char* dst, std::size_t n) override {
    if (!f_ || n == 0) return 0;
    std::size_t got = std::fread(dst, 1, n, f_);
    if (got == 0 && std::ferror(f_)) throw ReadError(with_errno("read failed", path_, errno));
    bytes_ += got;
    return got;
  }

  void close() override {
    if (!f_) return;
    std::FILE* f = f_;
    f_ = nullptr;
    if (std::fclose(f) != 0) throw CloseError(with_errno("close failed", path_, errno));
  }

  std::uint64_t bytes_read() const noexcept override { return bytes_; }

private:
  std::string path_;
  std::FILE* f_;
  std::uint64_t bytes_{0};
};

}

std::unique_ptr<ByteSource> open_file_source(const std::string& path) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    const int err = errno;
    throw OpenError(path, err, with_errno("cannot open", path, err));
  }
  return std::make_unique<FileByteSource>(path, f);
}

std::unique_ptr<ByteSource> open_source(const ViewConfig& cfg) {
  std::unique_ptr<ByteSource> src = cfg.compressed ? open_gzip_source(cfg.path)
                                                   : open_file_source(cfg.path);
  if (cfg.encoding) src = decode_source(std::move(src), *cfg.encoding, cfg.path);
  return src;
}

}
