#include "file_lines/run_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace fl {

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
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(c));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"lines\":" << p.lines << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"chars\":" << p.chars << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"lines_per_sec\":" << safe_num(p.lines_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"filename\":";   esc(o, p.filename); o << ",";
  o << "\"encoding\":";
  if (p.encoding.empty()) o << "null"; else esc(o, p.encoding);
  o << ",";
  o << "\"compressed\":" << (p.compressed ? "true" : "false") << ",";
  o << "\"mode\":";       esc(o, p.mode);     o << ",";
  o << "\"digest\":";     esc(o, p.digest);   o << ",";
  o << "\"file_size\":" << p.file_size;

  o << "}";
  return o.str();
}

}
