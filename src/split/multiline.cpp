#include "stream_splitter/multiline.hpp"
#include "stream_splitter/delimiters.hpp"
#include "stream_splitter/trim.hpp"

#include <utility>

namespace ss {

static Regex compile_pattern(const std::string& pattern, const char* which, BuildError* err) {
  std::string why;
  Regex re = compile_multiline(pattern, &why);
  if (!re) fail(err, ErrorKind::Config, std::string("compile ") + which + " regex: " + why);
  return re;
}

std::optional<Tokenizer> build_tokenizer(const MultilineConfig& cfg,
                                         const Codec& codec,
                                         bool flush_at_eof,
                                         std::size_t max_log_size,
                                         bool preserve_leading,
                                         bool preserve_trailing,
                                         BuildError* err) {
  const bool has_start = !cfg.line_start_pattern.empty();
  const bool has_end   = !cfg.line_end_pattern.empty();
  const TrimFunc trim  = select_trim(preserve_leading, preserve_trailing);

  if (has_start && has_end) {
    fail(err, ErrorKind::Config, "only one of line_start_pattern or line_end_pattern can be set");
    return std::nullopt;
  }

  if (codec.is_nop()) {
    if (has_start || has_end) {
      fail(err, ErrorKind::Config,
           "line_start_pattern or line_end_pattern should not be set when using nop encoding");
      return std::nullopt;
    }
    if (max_log_size == 0) {
      fail(err, ErrorKind::Config, "max_log_size must be greater than zero for nop encoding");
      return std::nullopt;
    }
    return Tokenizer(NoSplit{max_log_size}, &no_trim, flush_at_eof);
  }

  if (!has_start && !has_end) {
    auto delims = resolve_delimiters(codec, err);
    if (!delims) return std::nullopt;
    NewlineSplit s{std::move(delims->newline), std::move(delims->carriage_return), flush_at_eof, trim};
    return Tokenizer(std::move(s), trim, flush_at_eof);
  }

  if (has_end) {
    Regex re = compile_pattern(cfg.line_end_pattern, "line end", err);
    if (!re) return std::nullopt;
    return Tokenizer(LineEndSplit{std::move(re), flush_at_eof, trim}, trim, flush_at_eof);
  }

  if (has_start) {
    Regex re = compile_pattern(cfg.line_start_pattern, "line start", err);
    if (!re) return std::nullopt;
    return Tokenizer(LineStartSplit{std::move(re), flush_at_eof, trim}, trim, flush_at_eof);
  }

  fail(err, ErrorKind::Internal, "unreachable multiline configuration");
  return std::nullopt;
}

}
