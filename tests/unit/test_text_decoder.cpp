#include "chunkstream/text_decoder.hpp"
#include "../check.hpp"

#include <string>

int main() {
  // names
  CS_CHECK(cs::parse_encoding("utf8") == cs::Encoding::Utf8);
  CS_CHECK(cs::parse_encoding("UTF-8") == cs::Encoding::Utf8);
  CS_CHECK(cs::parse_encoding("Latin1") == cs::Encoding::Latin1);
  CS_CHECK(cs::parse_encoding("iso-8859-1") == cs::Encoding::Latin1);
  CS_CHECK(cs::parse_encoding("US-ASCII") == cs::Encoding::Ascii);
  CS_CHECK(!cs::parse_encoding("utf16").has_value());
  CS_CHECK(!cs::parse_encoding("").has_value());
  CS_CHECK_EQ(std::string(cs::encoding_name(cs::Encoding::Latin1)), std::string("latin1"));

  // incomplete suffix detection
  CS_CHECK_EQ(cs::utf8_incomplete_suffix(""), 0u);
  CS_CHECK_EQ(cs::utf8_incomplete_suffix("abc"), 0u);
  CS_CHECK_EQ(cs::utf8_incomplete_suffix("a\xC3"), 1u);
  CS_CHECK_EQ(cs::utf8_incomplete_suffix("a\xC3\xA9"), 0u);
  CS_CHECK_EQ(cs::utf8_incomplete_suffix("\xE2\x82"), 2u);
  CS_CHECK_EQ(cs::utf8_incomplete_suffix("\xF0\x9F\x98"), 3u);
  CS_CHECK_EQ(cs::utf8_incomplete_suffix("\xF0\x9F\x98\x80"), 0u);

  // default-constructed decoders (also as members of aggregates) are utf8
  {
    cs::TextDecoder d = {};
    CS_CHECK(d.encoding() == cs::Encoding::Utf8);
    struct Holder { int n; cs::TextDecoder dec; };
    Holder h{1};
    CS_CHECK(h.dec.encoding() == cs::Encoding::Utf8);
    CS_CHECK_EQ(h.dec.held_bytes(), 0u);
  }

  // a 4-byte sequence fed one byte at a time comes out whole
  {
    cs::TextDecoder d(cs::Encoding::Utf8);
    const std::string emoji = "\xF0\x9F\x98\x80";
    std::string out;
    for (int i = 0; i < 3; ++i) {
      CS_CHECK(d.decode(emoji.substr(i, 1), out));
      CS_CHECK(out.empty());
      CS_CHECK_EQ(d.held_bytes(), static_cast<std::size_t>(i + 1));
    }
    CS_CHECK(d.decode(emoji.substr(3, 1), out));
    CS_CHECK_EQ(out, emoji);
    CS_CHECK_EQ(d.held_bytes(), 0u);
    CS_CHECK_EQ(d.consumed(), 4u);
  }

  // finish() flushes a truncated sequence instead of dropping it
  {
    cs::TextDecoder d(cs::Encoding::Utf8);
    std::string out;
    CS_CHECK(d.decode("ok\xE2\x82", out));
    CS_CHECK_EQ(out, std::string("ok"));
    d.finish(out);
    CS_CHECK_EQ(out, std::string("ok\xE2\x82"));
  }

  // latin1 widens high bytes
  {
    cs::TextDecoder d(cs::Encoding::Latin1);
    std::string out;
    CS_CHECK(d.decode("\xE9t\xE9", out));
    CS_CHECK_EQ(out, std::string("\xC3\xA9t\xC3\xA9"));
  }

  // ascii rejects high bytes and reports the absolute offset
  {
    cs::TextDecoder d(cs::Encoding::Ascii);
    std::string out;
    CS_CHECK(d.decode("abc", out));
    CS_CHECK(!d.decode("d\x80", out));
    CS_CHECK(d.error().find("0x80") != std::string::npos);
    CS_CHECK(d.error().find("offset 4") != std::string::npos);
  }

  return cs_test::finish("text_decoder");
}
