#include "chunkstream/run_config.hpp"
#include "chunkstream/text_decoder.hpp"

#include <simdjson.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace cs {

static bool set_err(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

bool load_run_config(const std::string& path, RunConfig& cfg, std::string* err_out) {
  RunConfig out = cfg;
  try {
    simdjson::padded_string json = simdjson::padded_string::load(path).value();
    simdjson::ondemand::parser parser;
    simdjson::ondemand::document doc = parser.iterate(json).value();
    simdjson::ondemand::object obj = doc.get_object().value();

    for (auto field : obj) {
      std::string key(field.unescaped_key().value());
      simdjson::ondemand::value v = field.value();

      if (key == "read_buffer_size") {
        out.tokenize.reader.read_buffer_size = static_cast<std::size_t>(v.get_uint64().value());
      } else if (key == "chunk_size_threshold") {
        out.tokenize.reader.chunk_size_threshold = static_cast<std::size_t>(v.get_uint64().value());
      } else if (key == "max_token_bytes") {
        out.tokenize.max_token_bytes = static_cast<std::size_t>(v.get_uint64().value());
      } else if (key == "encoding") {
        std::string_view name = v.get_string().value();
        auto enc = parse_encoding(name);
        if (!enc) return set_err(err_out, path + ": unknown encoding \"" + std::string(name) + "\"");
        out.tokenize.reader.encoding = *enc;
      } else if (key == "delimiter") {
        out.delimiter = std::string(v.get_string().value());
      } else if (key == "summary") {
        out.summary_path = std::string(v.get_string().value());
      } else if (key == "strip_cr") {
        out.tokenize.strip_cr = v.get_bool().value();
      } else if (key == "print_tokens") {
        out.print_tokens = v.get_bool().value();
      } else {
        return set_err(err_out, path + ": unknown key \"" + key + "\"");
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    return set_err(err_out, path + ": " + e.what());
  }

  std::string verr;
  if (!validate(out, &verr)) return set_err(err_out, path + ": " + verr);
  cfg = std::move(out);
  return true;
}

bool unescape_delimiter(std::string_view in, std::string& out, std::string* err_out) {
  std::string s;
  s.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    char c = in[i];
    if (c != '\\') { s.push_back(c); continue; }
    if (i + 1 == in.size()) return set_err(err_out, "dangling backslash in delimiter");
    switch (in[++i]) {
      case 'n':  s.push_back('\n'); break;
      case 'r':  s.push_back('\r'); break;
      case 't':  s.push_back('\t'); break;
      case '0':  s.push_back('\0'); break;
      case '\\': s.push_back('\\'); break;
      default:
        return set_err(err_out, std::string("unknown escape \\") + in[i] + " in delimiter");
    }
  }
  out = std::move(s);
  return true;
}

bool validate(const RunConfig& cfg, std::string* err_out) {
  if (cfg.delimiter.empty()) return set_err(err_out, "delimiter must not be empty");
  if (cfg.tokenize.reader.read_buffer_size == 0) return set_err(err_out, "read_buffer_size must be positive");
  return true;
}

}
