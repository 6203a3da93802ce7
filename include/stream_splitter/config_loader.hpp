#pragma once
#include "stream_splitter/splitter_config.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace ss {

// Reader-level settings: the splitter block plus the knobs its build needs.
struct ReaderSettings {
  SplitterConfig splitter;
  std::size_t max_log_size = kDefaultMaxLogSize;
  bool        flush_at_eof = true;
  std::size_t chunk_bytes  = 64 * 1024;
};

// JSON config, e.g.
//   { "encoding": "utf-16le",
//     "multiline": { "line_start_pattern": "^\\d{4}-" },
//     "preserve_leading_whitespaces": false,
//     "preserve_trailing_whitespaces": false,
//     "force_flush_period": "500ms",      // or a number of milliseconds
//     "max_log_size": "1MiB",             // or a number of bytes
//     "flush_at_eof": true,
//     "chunk_bytes": 65536 }
// Missing keys keep their defaults; unknown keys are an error. `out` is only
// written on success.
bool load_settings_json(std::string_view json, ReaderSettings& out, std::string* err_out = nullptr);
bool load_settings_file(const std::string& path, ReaderSettings& out, std::string* err_out = nullptr);

}
