#include "file_lines/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace fl {

void MetricsRegistry::reset() {
  lines_ = bytes_ = chars_ = 0;
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.lines = lines_;
  r.bytes = bytes_;
  r.chars = chars_;
  r.wall_time_ms = wall_ms;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0*1024.0)) / sec : 0.0;
  r.lines_per_sec   = (sec > 0.0) ? lines_ / sec : 0.0;

  // stages in the order they were first started
  r.stages.reserve(stage_order_.size());
  for (auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    r.stages.push_back(StageTiming{name, it == stage_accum_ms_.end() ? 0 : it->second});
  }
  return r;
}

}
