#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "stream_splitter/build_error.hpp"
#include "stream_splitter/chunk_reader.hpp"
#include "stream_splitter/splitter_config.hpp"

using clk = std::chrono::steady_clock;

// Log-ish lines; every fourth record carries a two-line stack trace.
static std::string make_synth_log(std::size_t records) {
  std::string out;
  out.reserve(records * 96);
  for (size_t r = 0; r < records; ++r) {
    out += "2024-05-0";
    out += static_cast<char>('1' + r % 9);
    out += "T12:00:00Z INFO worker=";
    out += std::to_string(r % 64);
    out += " processed batch id=";
    out += std::to_string(r);
    out += '\n';
    if (r % 4 == 3) out += "  at handler.cc:42\n  at loop.cc:7\n";
  }
  return out;
}

struct Args {
  std::size_t records = 200'000;
  std::size_t chunk = 64 * 1024;
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--records") a.records = std::stoull(val);
    else if (key=="--chunk") a.chunk = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: ss_bench_splitter [--records=N] [--chunk=BYTES] [--iters=K]\n"
        "Splits a synthetic log with each boundary strategy.\n";
      std::exit(0);
    }
  }
  return a;
}

static void bench_one(const char* label, const ss::SplitterConfig& cfg,
                      const std::string& data, const Args& a) {
  ss::BuildError err;
  auto splitter = cfg.build(true, ss::kDefaultMaxLogSize, &err);
  if (!splitter) {
    std::cerr << "[bench] " << label << ": " << err.message << "\n";
    return;
  }

  std::cout << "\n[" << label << "] bytes=" << data.size() << " chunk=" << a.chunk
            << " iters=" << a.iters << "\n";
  for (int k=1;k<=a.iters;++k) {
    ss::ChunkReader::Config rcfg;
    rcfg.chunk_bytes = a.chunk;
    ss::ChunkReader rd(splitter->fork(), rcfg);
    std::uint64_t ntok = 0;

    auto t0 = clk::now();
    bool ok = true;
    for (std::size_t off = 0; ok && off < data.size(); off += a.chunk) {
      ok = rd.feed(std::string_view(data).substr(off, a.chunk), [&](std::string_view){ ++ntok; });
    }
    ok = ok && rd.finish([&](std::string_view){ ++ntok; });
    if (!ok) { std::cerr << "[bench] " << label << ": " << rd.error() << "\n"; return; }
    auto t1 = clk::now();

    const double sec = std::chrono::duration<double>(t1-t0).count();
    const double mib = rd.bytes_read() / (1024.0*1024.0);
    std::cout << "  iter " << k
              << ": tokens=" << ntok
              << " time=" << sec << "s"
              << "  throughput=" << (mib/sec) << " MiB/s"
              << "  tokens/s=" << (ntok/sec) << "\n";
  }
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);
  const std::string data = make_synth_log(a.records);

  ss::SplitterConfig newline;
  bench_one("newline", newline, data, a);

  ss::SplitterConfig start;
  start.multiline.line_start_pattern = "^\\d{4}-\\d{2}-\\d{2}T";
  bench_one("line_start", start, data, a);

  ss::SplitterConfig end;
  end.multiline.line_end_pattern = "processed batch id=\\d+$";
  bench_one("line_end", end, data, a);

  ss::SplitterConfig raw;
  raw.encoding = "nop";
  bench_one("nosplit", raw, data, a);
  return 0;
}
