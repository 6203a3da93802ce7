#pragma once
#include "stream_splitter/strategies.hpp"
#include "stream_splitter/trim.hpp"

#include <string_view>

namespace ss {

// A compiled boundary strategy plus the trim policy it was built with.
// Immutable after construction; one instance may serve many streams at once.
class Tokenizer {
public:
  Tokenizer(Strategy strategy, TrimFunc trim, bool flush_at_eof);

  SplitResult next(std::string_view data, bool at_eof) const;

  std::string_view trim(std::string_view s) const { return trim_(s); }
  bool flush_at_eof() const noexcept { return flush_at_eof_; }
  const Strategy& strategy() const noexcept { return strategy_; }
  const char* name() const noexcept { return strategy_name(strategy_); }

private:
  Strategy strategy_;
  TrimFunc trim_;
  bool flush_at_eof_;
};

}
