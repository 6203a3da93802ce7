#pragma once
#include "stream_splitter/strategies.hpp"
#include "stream_splitter/tokenizer.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string_view>

namespace ss {

constexpr std::chrono::nanoseconds kDefaultFlushPeriod = std::chrono::milliseconds(500);

struct FlusherConfig {
  // 0 disables forced flushing.
  std::chrono::nanoseconds period = kDefaultFlushPeriod;
};

// Idle-timeout wrapper around a tokenizer. When the tokenizer keeps asking
// for more data while the pending bytes have not changed for longer than
// `period`, the whole pending buffer is emitted as one (trimmed) record.
// Holds per-stream state; one Flusher per stream.
class Flusher {
public:
  using TimePoint = std::chrono::steady_clock::time_point;
  using Clock = std::function<TimePoint()>;

  explicit Flusher(std::chrono::nanoseconds period, Clock clock = {});

  SplitResult wrap(const Tokenizer& tok, std::string_view data, bool at_eof);

  // Same period and clock, fresh timing state.
  Flusher fresh() const { return Flusher(period_, clock_); }

  std::chrono::nanoseconds period() const noexcept { return period_; }

private:
  TimePoint now() const { return clock_ ? clock_() : std::chrono::steady_clock::now(); }
  bool should_flush() const;
  void update_data_change_time(std::size_t length);
  void flushed() { update_data_change_time(0); }

  std::chrono::nanoseconds period_;
  Clock clock_;
  TimePoint last_data_change_;
  std::size_t previous_data_length_{0};
};

}
