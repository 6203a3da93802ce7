#pragma once
#include "stream_splitter/trim.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <re2/re2.h>

namespace ss {

// Outcome of one tokenizer call over the unconsumed part of a stream.
//   need more data : advance == 0, no token, err empty
//   record         : token set (a view into the input), advance > 0 normally
//   failure        : err set; the strategies below never fail at call time,
//                    the field is for wrappers and read loops
struct SplitResult {
  std::size_t advance = 0;
  std::optional<std::string_view> token;
  std::string err;

  bool need_more() const noexcept { return advance == 0 && !token && err.empty(); }
  bool failed() const noexcept { return !err.empty(); }
};

// Fixed-size chunking for raw (nop) streams. Tokens are never trimmed.
struct NoSplit {
  std::size_t max_log_size;

  SplitResult next(std::string_view data, bool at_eof) const;
};

// Records end at the encoded newline; a trailing encoded CR is dropped.
struct NewlineSplit {
  std::string newline;
  std::string carriage_return;
  bool flush_at_eof;
  TrimFunc trim;

  SplitResult next(std::string_view data, bool at_eof) const;
};

// Compiled patterns are immutable and shared between tokenizer copies.
using Regex = std::shared_ptr<const re2::RE2>;

// Records begin where `re` matches.
struct LineStartSplit {
  Regex re;
  bool flush_at_eof;
  TrimFunc trim;

  SplitResult next(std::string_view data, bool at_eof) const;
};

// Records end where `re` matches; the match is part of the record.
struct LineEndSplit {
  Regex re;
  bool flush_at_eof;
  TrimFunc trim;

  SplitResult next(std::string_view data, bool at_eof) const;
};

using Strategy = std::variant<NoSplit, NewlineSplit, LineStartSplit, LineEndSplit>;

const char* strategy_name(const Strategy& s) noexcept;

// Multi-line pattern compile: '^'/'$' match at embedded '\n' and '.' does
// not match a newline. Returns null (and sets *err_out) on bad syntax.
Regex compile_multiline(const std::string& pattern, std::string* err_out = nullptr);

}
