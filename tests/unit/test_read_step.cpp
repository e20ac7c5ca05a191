#include "chunkstream/chunk_reader.hpp"
#include "../check.hpp"

#include <string>
#include <vector>

// advance() is exercised directly on a ReadState; no file is involved.

static cs::ReadState fresh(std::uint64_t size, cs::Encoding enc = cs::Encoding::Utf8) {
  cs::ReadState st;
  st.file_size = size;
  st.decoder = cs::TextDecoder(enc);
  st.phase = cs::ReadPhase::Reading;
  return st;
}

static void accumulates_until_threshold() {
  cs::ChunkOptions opts{4, 4, cs::Encoding::Utf8};
  std::vector<std::pair<std::string, bool>> seen;
  auto cb = [&](std::string_view text, bool is_final) {
    seen.emplace_back(std::string(text), is_final);
    return cs::ChunkResult::Continue(std::string(text.substr(text.size() - 1)));
  };

  cs::ReadState st = fresh(10);
  st = cs::advance(std::move(st), "abc", opts, cb);
  CS_CHECK(seen.empty());
  CS_CHECK_EQ(st.pending, std::string("abc"));
  CS_CHECK_EQ(st.cursor, 3u);
  CS_CHECK(st.phase == cs::ReadPhase::Reading);

  st = cs::advance(std::move(st), "de", opts, cb);
  CS_CHECK_EQ(seen.size(), 1u);
  CS_CHECK_EQ(st.pending, std::string("e"));
  CS_CHECK_EQ(st.dispatches, 1u);

  st = cs::advance(std::move(st), "fghij", opts, cb);
  CS_CHECK_EQ(seen.size(), 2u);
  if (seen.size() == 2) {
    CS_CHECK_EQ(seen[0].first, std::string("abcde"));
    CS_CHECK(!seen[0].second);
    CS_CHECK_EQ(seen[1].first, std::string("efghij"));
    CS_CHECK(seen[1].second);
  }
  CS_CHECK(st.phase == cs::ReadPhase::Closing);
  CS_CHECK_EQ(st.cursor, 10u);
}

static void state_is_a_value() {
  cs::ChunkOptions opts{4, 0, cs::Encoding::Utf8};
  cs::ReadState st = fresh(6);
  st = cs::advance(std::move(st), "ab", opts,
                   [](std::string_view, bool) { return cs::ChunkResult::Continue("b"); });
  const cs::ReadState snapshot = st;

  auto keep_all = [](std::string_view t, bool) { return cs::ChunkResult::Continue(std::string(t)); };
  cs::ReadState a = cs::advance(st, "cd", opts, keep_all);
  cs::ReadState b = cs::advance(st, "xy", opts, keep_all);
  CS_CHECK_EQ(a.pending, std::string("bcd"));
  CS_CHECK_EQ(b.pending, std::string("bxy"));
  CS_CHECK_EQ(st.pending, snapshot.pending);
  CS_CHECK_EQ(st.cursor, snapshot.cursor);
}

static void failure_result_ends_step() {
  cs::ChunkOptions opts{4, 0, cs::Encoding::Utf8};
  cs::ReadState st = fresh(8);
  st = cs::advance(std::move(st), "abcd", opts,
                   [](std::string_view, bool) { return cs::ChunkResult::Fail("rejected"); });
  CS_CHECK(st.phase == cs::ReadPhase::Failed);
  CS_CHECK(st.error.has_value());
  if (st.error) {
    CS_CHECK(st.error->kind == cs::ErrorKind::Callback);
    CS_CHECK_EQ(st.error->message, std::string("rejected"));
  }
}

static void empty_carry_is_not_failure() {
  cs::ChunkResult ok = cs::ChunkResult::Continue();
  CS_CHECK(ok.ok());
  CS_CHECK(ok.carry().empty());
  cs::ChunkResult bad = cs::ChunkResult::Fail("");
  CS_CHECK(bad.failed());
}

static void zero_length_final_step() {
  cs::ChunkOptions opts{};
  int calls = 0;
  bool final_seen = false;
  cs::ReadState st = fresh(0);
  st = cs::advance(std::move(st), "", opts, [&](std::string_view t, bool is_final) {
    ++calls; final_seen = is_final && t.empty();
    return cs::ChunkResult::Continue();
  });
  CS_CHECK_EQ(calls, 1);
  CS_CHECK(final_seen);
  CS_CHECK(st.phase == cs::ReadPhase::Closing);
}

static void decode_error_fails_step() {
  cs::ChunkOptions opts{4, 0, cs::Encoding::Ascii};
  int calls = 0;
  cs::ReadState st = fresh(4, cs::Encoding::Ascii);
  st = cs::advance(std::move(st), "ab\xFF" "c", opts,
                   [&](std::string_view, bool) { ++calls; return cs::ChunkResult::Continue(); });
  CS_CHECK_EQ(calls, 0);
  CS_CHECK(st.phase == cs::ReadPhase::Failed);
  CS_CHECK(st.error && st.error->kind == cs::ErrorKind::Decode);
  CS_CHECK(st.error && st.error->message.find("offset 2") != std::string::npos);
}

int main() {
  accumulates_until_threshold();
  state_is_a_value();
  failure_result_ends_step();
  empty_carry_is_not_failure();
  zero_length_final_step();
  decode_error_fails_step();
  return cs_test::finish("read_step");
}
