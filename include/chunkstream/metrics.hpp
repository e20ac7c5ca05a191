#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cs {

struct StageTiming {
  std::string name;
  std::uint64_t duration_us = 0;
  std::uint64_t calls = 0;
};

struct RunStats {
  std::uint64_t tokens = 0;
  std::uint64_t empty_tokens = 0;
  std::uint64_t longest_token = 0;
  std::uint64_t chunks = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double tokens_per_sec = 0.0;

  std::vector<StageTiming> stages;   // sorted by name
};

class MetricsRegistry {
public:
  void reset();
  void add_chunk() noexcept { ++chunks_; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void add_token(std::uint64_t len) noexcept {
    ++tokens_;
    if (len == 0) ++empty_tokens_;
    if (len > longest_token_) longest_token_ = len;
  }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  std::uint64_t tokens() const noexcept { return tokens_; }
  std::uint64_t chunks() const noexcept { return chunks_; }
  std::uint64_t bytes() const noexcept { return bytes_; }

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t tokens_{0};
  std::uint64_t empty_tokens_{0};
  std::uint64_t longest_token_{0};
  std::uint64_t chunks_{0};
  std::uint64_t bytes_{0};
  std::unordered_map<std::string, std::uint64_t> stage_accum_us_;
  std::unordered_map<std::string, std::uint64_t> stage_calls_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
