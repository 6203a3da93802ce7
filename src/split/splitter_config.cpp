#include "stream_splitter/splitter_config.hpp"
#include "stream_splitter/codec.hpp"

#include <memory>
#include <utility>

namespace ss {

std::optional<Splitter> SplitterConfig::build(bool flush_at_eof,
                                              std::size_t max_log_size,
                                              BuildError* err,
                                              Flusher::Clock clock) const {
  auto codec = lookup_codec(encoding, err);
  if (!codec) return std::nullopt;

  auto tok = build_tokenizer(multiline, *codec, flush_at_eof, max_log_size,
                             preserve_leading_whitespaces, preserve_trailing_whitespaces, err);
  if (!tok) return std::nullopt;

  return Splitter(std::make_shared<const Tokenizer>(std::move(*tok)),
                  Flusher(flusher.period, std::move(clock)));
}

}
