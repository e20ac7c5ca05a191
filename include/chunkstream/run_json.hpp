#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cs {

struct RunSummary {
  // Outcome
  bool ok = true;
  std::string error_kind;   // empty when ok
  std::string error;

  // Top-level KPIs
  std::uint64_t tokens = 0;
  std::uint64_t empty_tokens = 0;
  std::uint64_t longest_token = 0;
  std::uint64_t chunks = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double tokens_per_sec = 0.0;

  // (stage, microseconds)
  std::vector<std::pair<std::string, std::uint64_t>> stage_times;

  // Input and options
  std::string filename;
  std::uint64_t file_size = 0;
  std::string mode = "tokenize";   // "tokenize" | "chunks"
  std::string delimiter;
  std::string encoding;
  std::uint64_t read_buffer_size = 0;
  std::uint64_t chunk_size_threshold = 0;
};

class RunJsonWriter {
public:
  // Serialize summary to a compact JSON object.
  static std::string to_json(const RunSummary& s);
};

}
