#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace fl {

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t lines = 0;
  std::uint64_t bytes = 0;          // bytes read from the file (compressed for gzip)
  std::uint64_t chars = 0;          // decoded line bytes, terminators excluded
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double lines_per_sec = 0.0;

  std::vector<std::pair<std::string, std::uint64_t>> stage_times;

  // Input metadata
  std::string filename;
  std::string encoding;             // empty = platform default
  bool compressed = false;
  std::string mode;
  std::string digest;               // LineDigest hex
  std::uint64_t file_size = 0;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const RunJsonPayload& p);
};

}
