#include "stream_splitter/run_json.hpp"
#include <cmath> // std::isfinite
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace ss {

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
          o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(c) << std::dec << std::setfill(' ');
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
  o << "\"tokens\":" << p.tokens << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"tokens_per_sec\":" << safe_num(p.tokens_per_sec) << ",";
  o << "\"truncated\":" << p.truncated << ",";
  o << "\"dropped_bytes\":" << p.dropped_bytes << ",";
  o << "\"pending_bytes\":" << p.pending_bytes << ",";
  o << "\"strategy\":"; esc(o, p.strategy); o << ",";
  o << "\"encoding\":"; esc(o, p.encoding); o << ",";
  o << "\"filename\":"; esc(o, p.filename); o << ",";
  o << "\"file_size\":" << p.file_size;
  o << "}";
  return o.str();
}

bool RunJsonWriter::write_file(const std::string& path, const RunJsonPayload& p,
                               std::string* err_out) {
  const std::filesystem::path out(path);
  std::error_code ec;
  if (out.has_parent_path()) std::filesystem::create_directories(out.parent_path(), ec);

  std::ofstream f(out, std::ios::binary);
  if (!f) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  const std::string json = to_json(p);
  f.write(json.data(), static_cast<std::streamsize>(json.size()));
  return static_cast<bool>(f);
}

}
