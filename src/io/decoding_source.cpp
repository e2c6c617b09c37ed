#include "file_lines/byte_source.hpp"
#include "file_lines/errors.hpp"

#include <iconv.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>
#include <vector>

namespace fl {

namespace {

constexpr std::size_t kDecodeInputBytes  = 16 * 1024;
constexpr std::size_t kDecodeOutputBytes = 64 * 1024;
constexpr char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD in UTF-8
constexpr std::size_t kReplacementLen = 3;

const iconv_t kBadIconv = reinterpret_cast<iconv_t>(-1);

class DecodingByteSource final : public ByteSource {
public:
  DecodingByteSource(std::unique_ptr<ByteSource> inner, iconv_t cd, std::string encoding)
    : inner_(std::move(inner)), cd_(cd), encoding_(std::move(encoding)),
      in_(kDecodeInputBytes), out_(kDecodeOutputBytes) {}

  ~DecodingByteSource() override {
    if (cd_ != kBadIconv) iconv_close(cd_);
  }

  std::size_t read(char* dst, std::size_t n) override {
    if (n == 0) return 0;
    while (out_pos_ == out_len_) {
      if (!convert_more()) return 0;
    }
    const std::size_t k = std::min(n, out_len_ - out_pos_);
    std::memcpy(dst, out_.data() + out_pos_, k);
    out_pos_ += k;
    return k;
  }

  void close() override {
    if (cd_ != kBadIconv) { iconv_close(cd_); cd_ = kBadIconv; }
    inner_->close();
  }

  std::uint64_t bytes_read() const noexcept override { return inner_->bytes_read(); }

private:
  // Move unconsumed input to the front and append what the inner source has.
  void refill_input() {
    if (in_pos_ > 0) {
      std::memmove(in_.data(), in_.data() + in_pos_, in_len_ - in_pos_);
      in_len_ -= in_pos_;
      in_pos_ = 0;
    }
    if (in_len_ == in_.size()) return;
    const std::size_t got = inner_->read(in_.data() + in_len_, in_.size() - in_len_);
    if (got == 0) eof_ = true;
    in_len_ += got;
  }

  bool emit_replacement(char*& op, std::size_t& oleft) {
    if (oleft < kReplacementLen) return false;
    std::memcpy(op, kReplacement, kReplacementLen);
    op += kReplacementLen;
    oleft -= kReplacementLen;
    return true;
  }

  // Refill out_ with converted text; false once everything was delivered.
  bool convert_more() {
    if (cd_ == kBadIconv) return false;
    out_pos_ = out_len_ = 0;
    char* op = out_.data();
    std::size_t oleft = out_.size();

    while (op == out_.data()) {
      if (in_pos_ == in_len_ && !eof_) refill_input();
      if (in_pos_ == in_len_ && eof_) {
        if (flushed_) break;
        iconv(cd_, nullptr, nullptr, &op, &oleft); // shift state reset
        flushed_ = true;
        break;
      }

      char* ip = in_.data() + in_pos_;
      std::size_t ileft = in_len_ - in_pos_;
      const std::size_t r = iconv(cd_, &ip, &ileft, &op, &oleft);
      const int err = errno;
      in_pos_ = in_len_ - ileft;
      if (r != static_cast<std::size_t>(-1)) continue;

      if (err == E2BIG) break;
      if (err == EILSEQ) {
        if (!emit_replacement(op, oleft)) break;
        ++in_pos_;
      } else if (err == EINVAL) {
        // Incomplete sequence at the end of the buffer.
        if (eof_) {
          if (!emit_replacement(op, oleft)) break;
          in_pos_ = in_len_;
        } else {
          refill_input();
        }
      } else {
        throw ReadError("decoding " + encoding_ + " failed: " + std::system_category().message(err));
      }
    }

    out_len_ = static_cast<std::size_t>(op - out_.data());
    return out_len_ > 0;
  }

  std::unique_ptr<ByteSource> inner_;
  iconv_t cd_;
  std::string encoding_;
  std::vector<char> in_;
  std::vector<char> out_;
  std::size_t in_pos_{0}, in_len_{0};
  std::size_t out_pos_{0}, out_len_{0};
  bool eof_{false};
  bool flushed_{false};
};

}

std::unique_ptr<ByteSource> decode_source(std::unique_ptr<ByteSource> inner,
                                          const std::string& encoding,
                                          const std::string& path) {
  iconv_t cd = iconv_open("UTF-8", encoding.c_str());
  if (cd == kBadIconv) {
    const int err = errno;
    throw OpenError(path, err, "unsupported encoding '" + encoding + "': " + path);
  }
  return std::make_unique<DecodingByteSource>(std::move(inner), cd, encoding);
}

}
