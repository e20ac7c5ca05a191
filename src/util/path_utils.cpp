#include "chunkstream/path_utils.hpp"
#include <system_error>

namespace cs {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::uint64_t file_size_or_zero(const std::filesystem::path& p) {
  std::error_code ec;
  auto n = std::filesystem::file_size(p, ec);
  return ec ? 0 : static_cast<std::uint64_t>(n);
}

std::string printable(std::string_view s) {
  std::string out; out.reserve(s.size());
  auto push_hex = [&](unsigned char c){
    const char *hex = "0123456789ABCDEF";
    out += "\\x"; out += hex[c>>4]; out += hex[c&0xF];
  };
  for (unsigned char c : s) {
    if (c == '\n') { out += "\\n"; }
    else if (c == '\r') { out += "\\r"; }
    else if (c == '\t') { out += "\\t"; }
    else if (c == '\\') { out += "\\\\"; }
    else if (c < 0x20 || c == 0x7f) { push_hex(c); }
    else { out.push_back(static_cast<char>(c)); }
  }
  return out;
}

}
