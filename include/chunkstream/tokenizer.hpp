#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "chunkstream/chunk_reader.hpp"

namespace cs {

class MetricsRegistry;

struct TokenizeOptions {
  ChunkOptions reader;
  bool        strip_cr        = false;  // trim one trailing '\r' (CRLF input split on "\n")
  std::size_t max_token_bytes = 0;      // 0 = unlimited; larger tokens fail the run
};

// Return false to stop the run; it then completes with a Callback error.
using TokenCallback = std::function<bool(std::string_view token)>;

// Naive whole-text split on every occurrence of `delimiter` (non-empty).
// Always yields at least one piece; consecutive delimiters yield empty pieces.
std::vector<std::string_view> split_tokens(std::string_view text, std::string_view delimiter);

class Tokenizer {
public:
  explicit Tokenizer(std::string delimiter);
  Tokenizer(std::string delimiter, TokenizeOptions opts);

  // Chunk step: emits every complete token of `text` and returns the
  // trailing fragment as carry. When `is_final`, the trailing fragment is
  // emitted too and the carry is empty.
  // `text` must begin with the carry returned by the previous call, as
  // ChunkReader guarantees; that prefix is not searched again.
  ChunkResult on_chunk(std::string_view text, bool is_final, const TokenCallback& on_token);

  // Streams `path` through a ChunkReader using on_chunk() as its step.
  void tokenize(const std::string& path, const TokenCallback& on_token,
                const CompleteCallback& on_complete);

  void attach_metrics(MetricsRegistry* metrics) noexcept { metrics_ = metrics; }

  const std::string& delimiter() const noexcept { return delim_; }
  const TokenizeOptions& options() const noexcept { return opts_; }
  std::uint64_t tokens() const noexcept { return tokens_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }

private:
  bool emit(std::string_view token, const TokenCallback& on_token, std::string& err);

  std::string delim_;
  TokenizeOptions opts_;
  MetricsRegistry* metrics_{nullptr};
  std::uint64_t tokens_{0};
  std::uint64_t bytes_{0};
  std::size_t carry_len_{0};   // delimiter-free prefix of the next chunk
};

void tokenize(const std::string& path,
              const std::string& delimiter,
              const TokenCallback& on_token,
              const CompleteCallback& on_complete,
              const TokenizeOptions& opts = {});

}
