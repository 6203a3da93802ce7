#pragma once
#include "stream_splitter/build_error.hpp"
#include "stream_splitter/codec.hpp"
#include "stream_splitter/tokenizer.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace ss {

// `multiline` block of a reader configuration. At most one pattern may be set.
struct MultilineConfig {
  std::string line_start_pattern;
  std::string line_end_pattern;
};

// Validates `cfg` against the codec and picks the boundary strategy:
//   nop codec            -> NoSplit(max_log_size)
//   no pattern           -> NewlineSplit with the codec's newline bytes
//   line_end_pattern     -> LineEndSplit
//   line_start_pattern   -> LineStartSplit
// Both patterns, a pattern on a nop codec, a bad regex or a zero max_log_size
// for nop are ErrorKind::Config.
std::optional<Tokenizer> build_tokenizer(const MultilineConfig& cfg,
                                         const Codec& codec,
                                         bool flush_at_eof,
                                         std::size_t max_log_size,
                                         bool preserve_leading,
                                         bool preserve_trailing,
                                         BuildError* err = nullptr);

}
