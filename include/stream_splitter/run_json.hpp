#pragma once
#include <cstdint>
#include <string>

namespace ss {

// Summary of one split run over one input.
struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t tokens = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double tokens_per_sec = 0.0;

  // Guard and end-of-stream accounting
  std::uint64_t truncated = 0;
  std::uint64_t dropped_bytes = 0;
  std::uint64_t pending_bytes = 0;

  // Splitter and input metadata
  std::string strategy;
  std::string encoding;
  std::string filename;
  std::uint64_t file_size = 0;
};

class RunJsonWriter {
public:
  // Serialize payload to a single-line JSON object.
  static std::string to_json(const RunJsonPayload& p);

  // to_json() into `path`; false (with *err_out) when the file cannot be written.
  static bool write_file(const std::string& path, const RunJsonPayload& p,
                         std::string* err_out = nullptr);
};

}
