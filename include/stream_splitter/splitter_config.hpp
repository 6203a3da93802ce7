#pragma once
#include "stream_splitter/build_error.hpp"
#include "stream_splitter/flusher.hpp"
#include "stream_splitter/multiline.hpp"
#include "stream_splitter/splitter.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace ss {

constexpr std::size_t kDefaultMaxLogSize = 1024 * 1024; // 1 MiB

// Everything a reader needs to cut its byte stream into records.
struct SplitterConfig {
  std::string     encoding = "utf-8";
  FlusherConfig   flusher;
  MultilineConfig multiline;
  bool preserve_leading_whitespaces  = false;
  bool preserve_trailing_whitespaces = false;

  // Looks up the codec, builds the tokenizer and wraps it in a Flusher.
  // `clock` is only for tests; empty means steady_clock.
  std::optional<Splitter> build(bool flush_at_eof,
                                std::size_t max_log_size,
                                BuildError* err = nullptr,
                                Flusher::Clock clock = {}) const;
};

}
