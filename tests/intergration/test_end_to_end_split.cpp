#include "stream_splitter/chunk_reader.hpp"
#include "stream_splitter/config_loader.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main(){
  const fs::path dir = fs::temp_directory_path() / "ss_end_to_end";
  fs::create_directories(dir);
  const fs::path config = dir / "splitter.json";
  const fs::path log = dir / "app.log";

  {
    std::ofstream c(config);
    c << R"({
      "encoding": "utf-8",
      "multiline": { "line_start_pattern": "^\\d{4}-\\d{2}-\\d{2}" },
      "force_flush_period": "0",
      "max_log_size": "64KiB",
      "chunk_bytes": 7
    })";
  }
  {
    std::ofstream l(log, std::ios::binary);
    l << "2024-01-01 10:00:00 INFO start\n"
         "2024-01-01 10:00:01 ERROR boom\n"
         "  at frame1\n"
         "  at frame2\n"
         "2024-01-01 10:00:02 INFO done\n";
  }

  ss::ReaderSettings settings;
  std::string err;
  if (!ss::load_settings_file(config.string(), settings, &err)) {
    std::cerr << "[FAIL] load config: " << err << "\n";
    return 1;
  }

  ss::BuildError berr;
  auto splitter = settings.splitter.build(settings.flush_at_eof, settings.max_log_size, &berr);
  if (!splitter) {
    std::cerr << "[FAIL] build: " << berr.message << "\n";
    return 1;
  }
  expect(splitter->tokenizer().name() == std::string("line_start"), "line_start strategy selected");

  const std::vector<std::string> want = {
    "2024-01-01 10:00:00 INFO start",
    "2024-01-01 10:00:01 ERROR boom\n  at frame1\n  at frame2",
    "2024-01-01 10:00:02 INFO done",
  };

  // Two streams over one compiled tokenizer, each with its own reader.
  std::vector<std::string> got[2];
  bool ok[2] = {false, false};
  std::size_t chunks[2] = {settings.chunk_bytes, 1};
  std::vector<std::thread> workers;
  for (int i = 0; i < 2; ++i) {
    workers.emplace_back([&, i, s = splitter->fork()]() mutable {
      ss::ChunkReader::Config rc;
      rc.chunk_bytes = chunks[i];
      rc.max_record_bytes = settings.max_log_size;
      ss::ChunkReader r(std::move(s), rc);
      ok[i] = r.for_each_token(log.string(), [&](std::string_view t) { got[i].emplace_back(t); });
    });
  }
  for (auto& t : workers) t.join();

  expect(ok[0] && ok[1], "both streams read");
  expect(got[0] == want, "stream 0 records");
  expect(got[1] == want, "stream 1 records");

  fs::remove_all(dir);

  if (failures) return 1;
  std::cout << "[PASS] end to end split\n";
  return 0;
}
