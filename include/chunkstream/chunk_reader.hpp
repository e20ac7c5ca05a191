#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "chunkstream/text_decoder.hpp"

namespace cs {

class MetricsRegistry;

enum class ErrorKind { Open, Read, Decode, Callback, Close, InvalidOptions };
const char* to_string(ErrorKind kind) noexcept;

struct ReadError {
  ErrorKind   kind = ErrorKind::Read;
  int         sys_errno = 0;   // 0 when the failure did not come from the OS
  std::string message;
};

// What a chunk callback hands back to the reader: either the carry to
// prepend to the next accumulation cycle, or a failure that ends the run.
class ChunkResult {
public:
  static ChunkResult Continue(std::string carry = {}) { return ChunkResult(false, std::move(carry)); }
  static ChunkResult Fail(std::string message) { return ChunkResult(true, std::move(message)); }

  bool ok() const noexcept { return !failed_; }
  bool failed() const noexcept { return failed_; }

  const std::string& carry() const noexcept { return text_; }
  const std::string& message() const noexcept { return text_; }
  std::string take_carry() { return std::move(text_); }

private:
  ChunkResult(bool failed, std::string text) : failed_(failed), text_(std::move(text)) {}
  bool failed_;
  std::string text_;
};

struct ChunkOptions {
  std::size_t read_buffer_size     = 2048;   // bytes per read, must be > 0
  std::size_t chunk_size_threshold = 10000;  // dispatch once pending text is larger
  Encoding    encoding             = Encoding::Utf8;
};

using ChunkCallback    = std::function<ChunkResult(std::string_view text, bool is_final)>;
using CompleteCallback = std::function<void(const std::optional<ReadError>& err)>;

enum class ReadPhase { Opening, Reading, Dispatching, Closing, Done, Failed };
const char* to_string(ReadPhase phase) noexcept;

// Everything one read operation carries from step to step.
struct ReadState {
  std::uint64_t cursor     = 0;
  std::uint64_t file_size  = 0;
  std::string   pending;
  TextDecoder   decoder;
  ReadPhase     phase      = ReadPhase::Opening;
  std::optional<ReadError> error;
  std::uint64_t dispatches = 0;
};

// Folds one completed read of `raw` bytes into `state`: decodes, appends to
// the pending buffer, advances the cursor and dispatches to `on_chunk` when
// the pending text exceeds the threshold or the cursor reached file_size.
// Returns the state with phase Reading, Closing or Failed.
ReadState advance(ReadState state, std::string_view raw,
                  const ChunkOptions& opts, const ChunkCallback& on_chunk);

class ChunkReader {
public:
  explicit ChunkReader(std::string path);            // uses default ChunkOptions{}
  ChunkReader(std::string path, ChunkOptions opts);
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Runs one complete read operation. on_complete fires exactly once, after
  // the last on_chunk call; the file is closed before it fires.
  void process(const ChunkCallback& on_chunk, const CompleteCallback& on_complete);

  // Optional; must outlive process().
  void attach_metrics(MetricsRegistry* metrics) noexcept;

  const std::string&  path() const noexcept;
  const ChunkOptions& options() const noexcept;
  ReadPhase     phase() const noexcept;
  int           last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t chunks_dispatched() const noexcept;

private:
  struct Impl; Impl* p_;
};

void process(const std::string& path,
             const ChunkCallback& on_chunk,
             const CompleteCallback& on_complete,
             const ChunkOptions& opts = {});

}
