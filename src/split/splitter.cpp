#include "stream_splitter/splitter.hpp"
#include <utility>

namespace ss {

Splitter::Splitter(std::shared_ptr<const Tokenizer> tokenizer, Flusher flusher)
  : tokenizer_(std::move(tokenizer)), flusher_(std::move(flusher)) {}

SplitResult Splitter::next(std::string_view data, bool at_eof) {
  return flusher_.wrap(*tokenizer_, data, at_eof);
}

Splitter Splitter::fork() const { return Splitter(tokenizer_, flusher_.fresh()); }

}
