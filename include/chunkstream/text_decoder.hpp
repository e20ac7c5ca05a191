#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cs {

// Text encoding of the source file. Decoded text is always UTF-8.
enum class Encoding { Utf8, Latin1, Ascii };

// Accepts "utf8", "utf-8", "latin1", "iso-8859-1", "ascii", "us-ascii" (any case).
std::optional<Encoding> parse_encoding(std::string_view name);
const char* encoding_name(Encoding enc) noexcept;

// Incremental decoder fed one raw read at a time.
//
// UTF-8 input is passed through unchanged, except that an incomplete
// multi-byte sequence at the end of a read is held back until the next
// read completes it. finish() flushes whatever is still held, so no byte
// is ever dropped; malformed sequences are passed through as-is.
class TextDecoder {
public:
  TextDecoder() = default;
  explicit TextDecoder(Encoding enc) : enc_(enc) {}

  // Appends decoded text to `out`. Returns false (see error()) on a byte
  // the encoding cannot represent.
  bool decode(std::string_view raw, std::string& out);
  void finish(std::string& out);

  Encoding encoding() const noexcept { return enc_; }
  std::size_t held_bytes() const noexcept { return tail_.size(); }
  std::uint64_t consumed() const noexcept { return consumed_; }
  const std::string& error() const noexcept { return err_; }

private:
  Encoding enc_{Encoding::Utf8};
  std::string tail_;
  std::string err_;
  std::uint64_t consumed_{0};
};

// Length of the trailing bytes of `s` that start, but do not complete, a UTF-8 sequence.
std::size_t utf8_incomplete_suffix(std::string_view s) noexcept;

}
