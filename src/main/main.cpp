#include "stream_splitter/build_error.hpp"
#include "stream_splitter/chunk_reader.hpp"
#include "stream_splitter/config_loader.hpp"
#include "stream_splitter/run_json.hpp"
#include "stream_splitter/splitter.hpp"
#include "stream_splitter/splitter_config.hpp"
#include "stream_splitter/unit_parse.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

struct Cli {
  std::string config_path;
  std::optional<std::string> encoding;
  std::optional<std::string> line_start;
  std::optional<std::string> line_end;
  std::optional<std::string> flush_period;
  std::optional<std::string> max_log_size;
  std::optional<std::string> chunk_bytes;
  bool preserve_leading = false;
  bool preserve_trailing = false;
  bool no_flush_at_eof = false;
  bool escape = false;
  std::string report_dir;          // empty -> no run.json
  std::vector<std::string> files;
};

void usage(std::ostream& os) {
  os <<
    "Usage: stream-splitter [--config=FILE] [--encoding=NAME]\n"
    "                       [--line-start=REGEX | --line-end=REGEX]\n"
    "                       [--preserve-leading] [--preserve-trailing]\n"
    "                       [--flush-period=DUR] [--max-log-size=SIZE] [--no-flush-at-eof]\n"
    "                       [--chunk-bytes=SIZE] [--escape] [--report-dir=DIR] <file>...\n";
}

bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_opt = [&](const char* pfx, std::optional<std::string>* out){
      std::string v;
      if (!eat(pfx, &v)) return false;
      *out = v;
      return true;
    };
    if (eat("--config=", &c.config_path)) continue;
    if (eat_opt("--encoding=", &c.encoding)) continue;
    if (eat_opt("--line-start=", &c.line_start)) continue;
    if (eat_opt("--line-end=", &c.line_end)) continue;
    if (eat_opt("--flush-period=", &c.flush_period)) continue;
    if (eat_opt("--max-log-size=", &c.max_log_size)) continue;
    if (eat_opt("--chunk-bytes=", &c.chunk_bytes)) continue;
    if (eat("--report-dir=", &c.report_dir)) continue;
    if (a == "--preserve-leading")  { c.preserve_leading  = true; continue; }
    if (a == "--preserve-trailing") { c.preserve_trailing = true; continue; }
    if (a == "--no-flush-at-eof")   { c.no_flush_at_eof   = true; continue; }
    if (a == "--escape")            { c.escape            = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.rfind("--", 0) == 0) { std::cerr << "[split] unknown option: " << a << "\n"; return false; }
    c.files.push_back(a);
  }
  return true;
}

// Command-line values win over the config file.
bool apply_overrides(const Cli& c, ss::ReaderSettings& s, std::string* err) {
  if (c.encoding)   s.splitter.encoding = *c.encoding;
  if (c.line_start) s.splitter.multiline.line_start_pattern = *c.line_start;
  if (c.line_end)   s.splitter.multiline.line_end_pattern = *c.line_end;
  if (c.preserve_leading)  s.splitter.preserve_leading_whitespaces = true;
  if (c.preserve_trailing) s.splitter.preserve_trailing_whitespaces = true;
  if (c.no_flush_at_eof)   s.flush_at_eof = false;
  if (c.flush_period) {
    auto d = ss::parse_duration(*c.flush_period);
    if (!d) { *err = "invalid --flush-period: " + *c.flush_period; return false; }
    s.splitter.flusher.period = *d;
  }
  if (c.max_log_size) {
    auto n = ss::parse_byte_size(*c.max_log_size);
    if (!n) { *err = "invalid --max-log-size: " + *c.max_log_size; return false; }
    s.max_log_size = static_cast<std::size_t>(*n);
  }
  if (c.chunk_bytes) {
    auto n = ss::parse_byte_size(*c.chunk_bytes);
    if (!n || *n == 0) { *err = "invalid --chunk-bytes: " + *c.chunk_bytes; return false; }
    s.chunk_bytes = static_cast<std::size_t>(*n);
  }
  return true;
}

std::string escaped(std::string_view s) {
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

int split_one_file(const std::string& filepath,
                   ss::Splitter splitter,
                   const ss::ReaderSettings& settings,
                   const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();
  const std::string strategy = splitter.tokenizer().name();

  ss::ChunkReader::Config rcfg;
  rcfg.chunk_bytes = settings.chunk_bytes;
  rcfg.max_record_bytes = settings.max_log_size;
  ss::ChunkReader reader(std::move(splitter), rcfg);

  bool ok = reader.for_each_token(filepath, [&](std::string_view tok){
    if (cli.escape) std::cout << escaped(tok) << '\n';
    else { std::cout.write(tok.data(), static_cast<std::streamsize>(tok.size())); std::cout << '\n'; }
  });
  if (!ok) {
    std::cerr << "[split] " << filepath << ": " << reader.error() << "\n";
    return 2;
  }

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();

  if (reader.pending_bytes() > 0) {
    std::cerr << "[split] " << filepath << ": " << reader.pending_bytes()
              << " unterminated bytes left at end of stream\n";
  }
  if (reader.truncated() > 0) {
    std::cerr << "[split] " << filepath << ": " << reader.truncated()
              << " records truncated at " << settings.max_log_size << " bytes\n";
  }

  if (cli.report_dir.empty()) return 0;

  const std::uint64_t bytes = reader.bytes_read();
  const double sec = wall_ms / 1000.0;

  ss::RunJsonPayload p{};
  p.tokens = reader.tokens();
  p.bytes = bytes;
  p.wall_time_ms = wall_ms;
  p.throughput_mb_s = sec > 0.0 ? (bytes / (1024.0 * 1024.0)) / sec : 0.0;
  p.tokens_per_sec = sec > 0.0 ? reader.tokens() / sec : 0.0;
  p.truncated = reader.truncated();
  p.dropped_bytes = reader.dropped_bytes();
  p.pending_bytes = reader.pending_bytes();
  p.strategy = strategy;
  p.encoding = settings.splitter.encoding;
  p.filename = filepath;
  std::error_code fec;
  p.file_size = std::filesystem::file_size(filepath, fec);

  const std::filesystem::path out = std::filesystem::path(cli.report_dir) /
      (std::filesystem::path(filepath).filename().string() + ".run.json");
  std::string err;
  if (!ss::RunJsonWriter::write_file(out.string(), p, &err)) {
    std::cerr << "[split] report: " << err << "\n";
    return 2;
  }
  std::cerr << "[split] report: " << out.string() << "\n";
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) { usage(std::cerr); return 1; }
  if (cli.files.empty()) { usage(std::cerr); return 1; }

  ss::ReaderSettings settings;
  std::string err;
  if (!cli.config_path.empty() && !ss::load_settings_file(cli.config_path, settings, &err)) {
    std::cerr << "[config] " << err << "\n";
    return 1;
  }
  if (!apply_overrides(cli, settings, &err)) {
    std::cerr << "[config] " << err << "\n";
    return 1;
  }

  ss::BuildError berr;
  auto splitter = settings.splitter.build(settings.flush_at_eof, settings.max_log_size, &berr);
  if (!splitter) {
    std::cerr << "[config] " << ss::error_kind_name(berr.kind) << " error: " << berr.message << "\n";
    return 1;
  }

  int rc = 0;
  for (const auto& f : cli.files) {
    int one = split_one_file(f, splitter->fork(), settings, cli);
    if (one != 0) rc = one;
  }
  return rc;
}
