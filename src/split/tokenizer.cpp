#include "stream_splitter/tokenizer.hpp"
#include <utility>

namespace ss {

Tokenizer::Tokenizer(Strategy strategy, TrimFunc trim, bool flush_at_eof)
  : strategy_(std::move(strategy)), trim_(trim), flush_at_eof_(flush_at_eof) {}

SplitResult Tokenizer::next(std::string_view data, bool at_eof) const {
  return std::visit([&](const auto& s) { return s.next(data, at_eof); }, strategy_);
}

}
