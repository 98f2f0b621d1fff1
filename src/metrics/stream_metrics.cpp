#include "row_streamer/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace rs {

void StreamMetrics::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void StreamMetrics::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

StreamStats StreamMetrics::snapshot(double wall_ms) const {
  StreamStats s;
  s.chunks = chunks_;
  s.rows = rows_;
  s.bytes = bytes_;
  s.persist_ok = persist_ok_.load(std::memory_order_relaxed);
  s.persist_failed = persist_failed_.load(std::memory_order_relaxed);
  s.wall_ms = wall_ms;
  s.rows_per_sec = (wall_ms > 0.0) ? rows_ / (wall_ms / 1000.0) : 0.0;

  s.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) s.stages.push_back(StageTiming{kv.first, kv.second});
  std::sort(s.stages.begin(), s.stages.end(),
            [](const StageTiming& a, const StageTiming& b){ return a.name < b.name; });
  return s;
}

}
