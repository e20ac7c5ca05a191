#include "chunkstream/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace cs {

void MetricsRegistry::reset() {
  tokens_ = empty_tokens_ = longest_token_ = chunks_ = bytes_ = 0;
  stage_accum_us_.clear();
  stage_calls_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_us_[key] += static_cast<std::uint64_t>(us);
  ++stage_calls_[key];
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.tokens = tokens_;
  r.empty_tokens = empty_tokens_;
  r.longest_token = longest_token_;
  r.chunks = chunks_;
  r.bytes = bytes_;
  r.wall_time_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;
  r.tokens_per_sec = (wall_ms > 0.0) ? tokens_ / (wall_ms / 1000.0) : 0.0;

  r.stages.reserve(stage_accum_us_.size());
  for (auto& kv : stage_accum_us_) {
    auto calls = stage_calls_.find(kv.first);
    r.stages.push_back(StageTiming{kv.first, kv.second, calls == stage_calls_.end() ? 0 : calls->second});
  }
  std::sort(r.stages.begin(), r.stages.end(),
            [](const StageTiming& a, const StageTiming& b){ return a.name < b.name; });
  return r;
}

}
