#include "chunkstream/chunk_reader.hpp"
#include "chunkstream/file_handle.hpp"
#include "chunkstream/metrics.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <new>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cs {

const char* to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Open:           return "open";
    case ErrorKind::Read:           return "read";
    case ErrorKind::Decode:         return "decode";
    case ErrorKind::Callback:       return "callback";
    case ErrorKind::Close:          return "close";
    case ErrorKind::InvalidOptions: return "invalid_options";
  }
  return "unknown";
}

const char* to_string(ReadPhase phase) noexcept {
  switch (phase) {
    case ReadPhase::Opening:     return "opening";
    case ReadPhase::Reading:     return "reading";
    case ReadPhase::Dispatching: return "dispatching";
    case ReadPhase::Closing:     return "closing";
    case ReadPhase::Done:        return "done";
    case ReadPhase::Failed:      return "failed";
  }
  return "unknown";
}

static ReadError os_error(ErrorKind kind, int err, const std::string& what, const std::string& path) {
  return ReadError{kind, err, what + " " + path + ": " + std::strerror(err)};
}

static void fail(ReadState& state, ReadError err) {
  state.phase = ReadPhase::Failed;
  state.error = std::move(err);
}

ReadState advance(ReadState state, std::string_view raw,
                  const ChunkOptions& opts, const ChunkCallback& on_chunk) {
  state.cursor += raw.size();
  if (!state.decoder.decode(raw, state.pending)) {
    fail(state, ReadError{ErrorKind::Decode, 0, state.decoder.error()});
    return state;
  }

  const bool is_final = state.cursor >= state.file_size;
  if (is_final) state.decoder.finish(state.pending);

  if (state.pending.size() > opts.chunk_size_threshold || is_final) {
    state.phase = ReadPhase::Dispatching;
    ++state.dispatches;
    try {
      ChunkResult r = on_chunk(state.pending, is_final);
      if (r.failed()) {
        fail(state, ReadError{ErrorKind::Callback, 0, r.message()});
        return state;
      }
      state.pending = r.take_carry();
    } catch (const std::exception& e) {
      fail(state, ReadError{ErrorKind::Callback, 0, std::string("chunk callback threw: ") + e.what()});
      return state;
    } catch (...) {
      fail(state, ReadError{ErrorKind::Callback, 0, "chunk callback threw a non-standard exception"});
      return state;
    }
  }

  state.phase = is_final ? ReadPhase::Closing : ReadPhase::Reading;
  return state;
}

struct ChunkReader::Impl {
  std::string path;
  ChunkOptions opts;
  MetricsRegistry* metrics{nullptr};
  ReadState st;
  int last_errno{0};

  void stage_begin(const char* name) { if (metrics) metrics->start_stage(name); }
  void stage_end(const char* name)   { if (metrics) metrics->end_stage(name); }

  void run(const ChunkCallback& on_chunk, const CompleteCallback& on_complete) {
    st = ReadState{};
    st.decoder = TextDecoder(opts.encoding);
    last_errno = 0;

    if (opts.read_buffer_size == 0) {
      fail(st, ReadError{ErrorKind::InvalidOptions, 0, "read_buffer_size must be positive"});
    } else if (!on_chunk) {
      fail(st, ReadError{ErrorKind::InvalidOptions, 0, "chunk callback is empty"});
    }

    ChunkCallback dispatch = on_chunk;
    if (metrics && on_chunk) {
      dispatch = [this, &on_chunk](std::string_view text, bool is_final) {
        metrics->add_chunk();
        metrics->start_stage("dispatch");
        try {
          ChunkResult r = on_chunk(text, is_final);
          metrics->end_stage("dispatch");
          return r;
        } catch (...) {
          metrics->end_stage("dispatch");
          throw;
        }
      };
    }

    FileHandle fh;
    std::vector<char> buf;

    while (true) {
      switch (st.phase) {
        case ReadPhase::Opening: {
          stage_begin("open");
          const bool opened = fh.open_readonly(path) && fh.size(st.file_size);
          stage_end("open");
          if (!opened) {
            last_errno = fh.last_errno();
            fail(st, os_error(ErrorKind::Open, last_errno, "cannot open", path));
            break;
          }
          // No read is ever larger than the file, so the buffer need not be either.
          const std::size_t buf_size = static_cast<std::size_t>(std::max<std::uint64_t>(
              1, std::min<std::uint64_t>(opts.read_buffer_size, st.file_size)));
          try {
            buf.resize(buf_size);
          } catch (const std::bad_alloc&) {
            fail(st, ReadError{ErrorKind::Read, ENOMEM,
                      "cannot allocate a " + std::to_string(buf_size) + " byte read buffer for " + path});
            break;
          }
          st.phase = ReadPhase::Reading;
          break;
        }

        case ReadPhase::Reading:
        case ReadPhase::Dispatching: {
          // Never read past the size captured at open; a growing file is read up to that size only.
          const std::uint64_t left = st.file_size - st.cursor;
          const std::size_t want = static_cast<std::size_t>(
              std::min<std::uint64_t>(opts.read_buffer_size, left));
          long long got = 0;
          if (want > 0) {
            stage_begin("read");
            got = fh.read_at(buf.data(), want, st.cursor);
            stage_end("read");
            if (got < 0) {
              last_errno = fh.last_errno();
              fail(st, os_error(ErrorKind::Read, last_errno, "read failed on", path));
              break;
            }
            if (got == 0) {
              fail(st, ReadError{ErrorKind::Read, 0,
                        "unexpected end of file " + path + " at offset " + std::to_string(st.cursor) +
                        " (size at open " + std::to_string(st.file_size) + ")"});
              break;
            }
            if (metrics) metrics->add_bytes(static_cast<std::uint64_t>(got));
          }
          st = advance(std::move(st), std::string_view(buf.data(), static_cast<std::size_t>(got)),
                       opts, dispatch);
          break;
        }

        case ReadPhase::Closing: {
          stage_begin("close");
          const bool closed = fh.close();
          stage_end("close");
          if (!closed) {
            last_errno = fh.last_errno();
            fail(st, os_error(ErrorKind::Close, last_errno, "close failed on", path));
            break;
          }
          st.phase = ReadPhase::Done;
          break;
        }

        case ReadPhase::Done:
          on_complete(std::nullopt);
          return;

        case ReadPhase::Failed:
          // The failure is what gets reported; the close outcome on this path is not.
          fh.reset();
          on_complete(st.error);
          return;
      }
    }
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), ChunkOptions{}) {}

ChunkReader::ChunkReader(std::string path, ChunkOptions opts)
  : p_(new Impl{std::move(path), opts}) {}

ChunkReader::~ChunkReader() { delete p_; }

void ChunkReader::process(const ChunkCallback& on_chunk, const CompleteCallback& on_complete) {
  p_->run(on_chunk, on_complete);
}

void ChunkReader::attach_metrics(MetricsRegistry* metrics) noexcept { p_->metrics = metrics; }

const std::string&  ChunkReader::path() const noexcept { return p_->path; }
const ChunkOptions& ChunkReader::options() const noexcept { return p_->opts; }
ReadPhase     ChunkReader::phase() const noexcept { return p_->st.phase; }
int           ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->st.cursor; }
std::uint64_t ChunkReader::chunks_dispatched() const noexcept { return p_->st.dispatches; }

void process(const std::string& path,
             const ChunkCallback& on_chunk,
             const CompleteCallback& on_complete,
             const ChunkOptions& opts) {
  ChunkReader reader(path, opts);
  reader.process(on_chunk, on_complete);
}

}
