#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace fl {

// SHA-256 over a line sequence, each line followed by '\n'. Independent of
// the file's own terminators, compression and encoding.
class LineDigest {
public:
  LineDigest();
  ~LineDigest();

  LineDigest(const LineDigest&) = delete;
  LineDigest& operator=(const LineDigest&) = delete;

  void add(std::string_view line);
  std::uint64_t lines() const noexcept;

  // Lowercase hex; the digest is finished after the first call.
  std::string hex();

private:
  struct Impl; Impl* p_;
};

}
