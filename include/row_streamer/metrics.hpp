#pragma once
#include <atomic>
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rs {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct StreamStats {
  std::uint64_t chunks = 0;
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;          // response bytes handed to the sink
  std::uint64_t persist_ok = 0;
  std::uint64_t persist_failed = 0;
  double wall_ms = 0.0;
  double rows_per_sec = 0.0;

  std::vector<StageTiming> stages; // "fetch", "serialize", "emit"
};

// Per-stream counters. The emitter thread owns the plain fields; the persist
// counters are bumped from persister worker threads.
class StreamMetrics {
public:
  void add_chunk(std::uint64_t rows, std::uint64_t bytes) noexcept { ++chunks_; rows_ += rows; bytes_ += bytes; }
  void add_persist_ok() noexcept { persist_ok_.fetch_add(1, std::memory_order_relaxed); }
  void add_persist_failed() noexcept { persist_failed_.fetch_add(1, std::memory_order_relaxed); }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  StreamStats snapshot(double wall_ms) const;

private:
  std::uint64_t chunks_{0};
  std::uint64_t rows_{0};
  std::uint64_t bytes_{0};
  std::atomic<std::uint64_t> persist_ok_{0};
  std::atomic<std::uint64_t> persist_failed_{0};
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
