#include "file_lines/line_digest.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

namespace fl {

struct LineDigest::Impl {
  SHA256_CTX ctx;
  std::uint64_t lines{0};
  std::string hex;     // set once finished
};

LineDigest::LineDigest() : p_(new Impl) { SHA256_Init(&p_->ctx); }

LineDigest::~LineDigest() { delete p_; }

void LineDigest::add(std::string_view line) {
  SHA256_Update(&p_->ctx, line.data(), line.size());
  SHA256_Update(&p_->ctx, "\n", 1);
  ++p_->lines;
}

std::uint64_t LineDigest::lines() const noexcept { return p_->lines; }

std::string LineDigest::hex() {
  if (!p_->hex.empty()) return p_->hex;
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256_Final(md, &p_->ctx);
  std::ostringstream o;
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  p_->hex = o.str();
  return p_->hex;
}

}
