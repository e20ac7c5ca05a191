#include "chunkstream/text_decoder.hpp"
#include <cctype>
#include <cstdio>
#include <utility>
#include <string_view>

namespace cs {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::optional<Encoding> parse_encoding(std::string_view name) {
  if (ieq(name, "utf8") || ieq(name, "utf-8")) return Encoding::Utf8;
  if (ieq(name, "latin1") || ieq(name, "iso-8859-1")) return Encoding::Latin1;
  if (ieq(name, "ascii") || ieq(name, "us-ascii")) return Encoding::Ascii;
  return std::nullopt;
}

const char* encoding_name(Encoding enc) noexcept {
  switch (enc) {
    case Encoding::Utf8:   return "utf8";
    case Encoding::Latin1: return "latin1";
    case Encoding::Ascii:  return "ascii";
  }
  return "unknown";
}

std::size_t utf8_incomplete_suffix(std::string_view s) noexcept {
  const std::size_t lookback = s.size() < 3 ? s.size() : 3;
  for (std::size_t i = 1; i <= lookback; ++i) {
    const unsigned char c = static_cast<unsigned char>(s[s.size() - i]);
    if ((c & 0xC0) == 0x80) continue; // continuation byte, keep looking for the lead
    std::size_t need = 1;
    if (c >= 0xF0 && c <= 0xF7)      need = 4;
    else if (c >= 0xE0 && c < 0xF0)  need = 3;
    else if (c >= 0xC0 && c < 0xE0)  need = 2;
    return need > i ? i : 0;
  }
  return 0;
}

bool TextDecoder::decode(std::string_view raw, std::string& out) {
  switch (enc_) {
    case Encoding::Utf8: {
      std::string_view data = raw;
      if (!tail_.empty()) { tail_.append(raw); data = tail_; }
      const std::size_t keep = utf8_incomplete_suffix(data);
      out.append(data.data(), data.size() - keep);
      std::string rest(data.substr(data.size() - keep));
      tail_ = std::move(rest);
      break;
    }
    case Encoding::Latin1:
      out.reserve(out.size() + raw.size());
      for (unsigned char c : raw) {
        if (c < 0x80) { out.push_back(static_cast<char>(c)); continue; }
        out.push_back(static_cast<char>(0xC0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
      }
      break;
    case Encoding::Ascii:
      for (std::size_t i = 0; i < raw.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(raw[i]);
        if (c > 0x7F) {
          char tmp[96];
          std::snprintf(tmp, sizeof(tmp), "non-ASCII byte 0x%02X at offset %llu",
                        c, static_cast<unsigned long long>(consumed_ + i));
          err_ = tmp;
          out.append(raw.data(), i);
          consumed_ += i;
          return false;
        }
      }
      out.append(raw.data(), raw.size());
      break;
  }
  consumed_ += raw.size();
  return true;
}

void TextDecoder::finish(std::string& out) {
  out.append(tail_);
  tail_.clear();
}

}
