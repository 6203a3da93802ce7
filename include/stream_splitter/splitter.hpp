#pragma once
#include "stream_splitter/flusher.hpp"
#include "stream_splitter/strategies.hpp"
#include "stream_splitter/tokenizer.hpp"

#include <memory>
#include <string_view>

namespace ss {

// Per-stream splitter: a shared immutable Tokenizer composed with this
// stream's own Flusher state.
class Splitter {
public:
  Splitter(std::shared_ptr<const Tokenizer> tokenizer, Flusher flusher);

  SplitResult next(std::string_view data, bool at_eof);

  // Another stream over the same compiled tokenizer, with fresh flush state.
  Splitter fork() const;

  const Tokenizer& tokenizer() const noexcept { return *tokenizer_; }
  const std::shared_ptr<const Tokenizer>& shared_tokenizer() const noexcept { return tokenizer_; }

private:
  std::shared_ptr<const Tokenizer> tokenizer_;
  Flusher flusher_;
};

}
