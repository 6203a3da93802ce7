#include "stream_splitter/flusher.hpp"
#include <utility>

namespace ss {

Flusher::Flusher(std::chrono::nanoseconds period, Clock clock)
  : period_(period), clock_(std::move(clock)) {
  last_data_change_ = now();
}

bool Flusher::should_flush() const {
  return period_.count() > 0 && previous_data_length_ > 0 &&
         (now() - last_data_change_) > period_;
}

void Flusher::update_data_change_time(std::size_t length) {
  // Unchanged non-empty length means nothing new arrived.
  if (length > 0 && length == previous_data_length_) return;
  previous_data_length_ = length;
  last_data_change_ = now();
}

SplitResult Flusher::wrap(const Tokenizer& tok, std::string_view data, bool at_eof) {
  SplitResult r = tok.next(data, at_eof);
  if (r.failed()) return r;

  if (r.token) {
    flushed();
    return r;
  }

  if (!data.empty() && should_flush()) {
    flushed();
    r.token = tok.trim(data);
    r.advance = data.size();
    return r;
  }

  update_data_change_time(data.size());
  return r;
}

}
