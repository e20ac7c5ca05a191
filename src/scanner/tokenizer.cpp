#include "chunkstream/tokenizer.hpp"
#include "chunkstream/metrics.hpp"
#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

namespace cs {

std::vector<std::string_view> split_tokens(std::string_view text, std::string_view delimiter) {
  std::vector<std::string_view> out;
  if (delimiter.empty()) { out.push_back(text); return out; }
  std::size_t start = 0;
  std::size_t pos;
  while ((pos = text.find(delimiter, start)) != std::string_view::npos) {
    out.push_back(text.substr(start, pos - start));
    start = pos + delimiter.size();
  }
  out.push_back(text.substr(start));
  return out;
}

Tokenizer::Tokenizer(std::string delimiter)
  : Tokenizer(std::move(delimiter), TokenizeOptions{}) {}

Tokenizer::Tokenizer(std::string delimiter, TokenizeOptions opts)
  : delim_(std::move(delimiter)), opts_(opts) {}

bool Tokenizer::emit(std::string_view token, const TokenCallback& on_token, std::string& err) {
  if (opts_.max_token_bytes && token.size() > opts_.max_token_bytes) {
    err = "token of " + std::to_string(token.size()) + " bytes exceeds max_token_bytes=" +
          std::to_string(opts_.max_token_bytes);
    return false;
  }
  if (opts_.strip_cr && !token.empty() && token.back() == '\r') token.remove_suffix(1);
  ++tokens_;
  if (metrics_) metrics_->add_token(token.size());
  if (!on_token(token)) { err = "token callback stopped the run"; return false; }
  return true;
}

ChunkResult Tokenizer::on_chunk(std::string_view text, bool is_final, const TokenCallback& on_token) {
  if (delim_.empty()) return ChunkResult::Fail("delimiter must not be empty");

  // Only the last delim_.size()-1 bytes of the previous carry can begin a
  // delimiter, so a long unterminated token is scanned once, not per read.
  std::size_t from = 0;
  if (carry_len_ <= text.size()) from = carry_len_ - std::min(carry_len_, delim_.size() - 1);
  carry_len_ = 0;

  std::string err;
  std::size_t start = 0;
  std::size_t pos;
  while ((pos = text.find(delim_, std::max(start, from))) != std::string_view::npos) {
    if (!emit(text.substr(start, pos - start), on_token, err)) return ChunkResult::Fail(err);
    start = pos + delim_.size();
  }

  // The tail is bounded by end of file only when this is the last chunk;
  // otherwise its delimiter may still be in the bytes not read yet.
  std::string_view tail = text.substr(start);
  if (is_final) {
    if (!emit(tail, on_token, err)) return ChunkResult::Fail(err);
    return ChunkResult::Continue();
  }
  if (opts_.max_token_bytes && tail.size() > opts_.max_token_bytes) {
    return ChunkResult::Fail("unterminated token of " + std::to_string(tail.size()) +
                             " bytes exceeds max_token_bytes=" + std::to_string(opts_.max_token_bytes));
  }
  carry_len_ = tail.size();
  return ChunkResult::Continue(std::string(tail));
}

void Tokenizer::tokenize(const std::string& path, const TokenCallback& on_token,
                         const CompleteCallback& on_complete) {
  tokens_ = 0;
  bytes_ = 0;
  carry_len_ = 0;
  if (delim_.empty()) {
    on_complete(ReadError{ErrorKind::InvalidOptions, 0, "delimiter must not be empty"});
    return;
  }
  if (!on_token) {
    on_complete(ReadError{ErrorKind::InvalidOptions, 0, "token callback is empty"});
    return;
  }

  ChunkReader reader(path, opts_.reader);
  reader.attach_metrics(metrics_);
  reader.process(
    [&](std::string_view text, bool is_final) { return on_chunk(text, is_final, on_token); },
    [&](const std::optional<ReadError>& err) {
      bytes_ = reader.bytes_read();
      on_complete(err);
    });
}

void tokenize(const std::string& path,
              const std::string& delimiter,
              const TokenCallback& on_token,
              const CompleteCallback& on_complete,
              const TokenizeOptions& opts) {
  Tokenizer tok(delimiter, opts);
  tok.tokenize(path, on_token, on_complete);
}

}
