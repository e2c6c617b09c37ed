#include "file_lines/path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

namespace fl {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

bool looks_compressed(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return ext == ".gz" || ext == ".gzip";
}

std::string hex_hash_prefix(std::string_view data, int len) {
  if (len <= 0) return {};
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  std::ostringstream o;
  for (int i = 0; i < (len+1)/2 && i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  auto s = o.str();
  if ((int)s.size() > len) s.resize(len);
  return s;
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (len <= 0) return {};
  if (mode == "basename") {
    auto base = std::filesystem::path(std::string(key)).filename().string();
    if ((int)base.size() > len) base.resize(len);
    return base;
  }
  // default: hashprefix
  return hex_hash_prefix(key, len);
}

}
