#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace fl {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess gzip compression from the extension (.gz | .gzip).
bool looks_compressed(std::string_view path);

// Report directory name for an input: "hashprefix" (default) or "basename".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// First `len` hex digits of SHA-256(data).
std::string hex_hash_prefix(std::string_view data, int len);

}
