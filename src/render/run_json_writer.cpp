#include "chunkstream/run_json.hpp"
#include <sstream>
#include <cmath> // std::isfinite
#include <cstdio>

namespace cs {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << tmp;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunSummary& s) {
  std::ostringstream o;
  o << "{";
  o << "\"ok\":" << (s.ok ? "true" : "false") << ",";
  o << "\"error_kind\":"; esc(o, s.error_kind); o << ",";
  o << "\"error\":";      esc(o, s.error);      o << ",";

  o << "\"tokens\":" << s.tokens << ",";
  o << "\"empty_tokens\":" << s.empty_tokens << ",";
  o << "\"longest_token\":" << s.longest_token << ",";
  o << "\"chunks\":" << s.chunks << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"tokens_per_sec\":" << safe_num(s.tokens_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stage_times[i].first);
    o << ",\"duration_us\":" << s.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"filename\":";  esc(o, s.filename);  o << ",";
  o << "\"file_size\":" << s.file_size << ",";
  o << "\"mode\":";      esc(o, s.mode);      o << ",";
  o << "\"delimiter\":"; esc(o, s.delimiter); o << ",";
  o << "\"encoding\":";  esc(o, s.encoding);  o << ",";
  o << "\"read_buffer_size\":" << s.read_buffer_size << ",";
  o << "\"chunk_size_threshold\":" << s.chunk_size_threshold;

  o << "}";
  return o.str();
}

}
