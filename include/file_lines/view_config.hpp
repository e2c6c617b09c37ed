#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fl {

struct ViewConfig {
  std::string                path;
  std::optional<std::string> encoding;                 // nullopt = platform default (bytes as-is)
  bool                       compressed     = false;   // gzip
  std::size_t                chunk_bytes    = 64 * 1024;
  std::size_t                max_line_bytes = 0;       // 0 = unlimited
};

// Parse {"path": "...", "encoding": "...", "compressed": bool,
//        "chunk_bytes": N, "max_line_bytes": N}. Only "path" is required.
// Throws ConfigError.
ViewConfig parse_view_config(std::string_view json);

// Same, reading the JSON from a file.
ViewConfig load_view_config(const std::string& json_path);

}
