#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fl {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t lines = 0;
  std::uint64_t bytes = 0;
  std::uint64_t chars = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double lines_per_sec = 0.0;

  std::vector<StageTiming> stages;
};

class MetricsRegistry {
public:
  void reset();
  void add_line(std::size_t chars) noexcept { ++lines_; chars_ += chars; }
  void add_lines(std::uint64_t n) noexcept { lines_ += n; }
  void set_bytes(std::uint64_t b) noexcept { bytes_ = b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t lines_{0};
  std::uint64_t bytes_{0};
  std::uint64_t chars_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
