#pragma once
#include "stream_splitter/splitter.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace ss {

// The read loop around a Splitter. Owns the growing buffer, hands the
// unconsumed bytes to the splitter and slides the window by its advance.
// Bytes come either pushed (feed/finish) or from a file (for_each_token).
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 64 * 1024;   // fread size for files
    std::size_t max_record_bytes = 1024 * 1024; // guard per record (max_log_size)
    bool        drop_oversize    = false;       // drop, rather than truncate, over-guard records
  };

  // Tokens are views into the reader's buffer, valid only during the call.
  using TokenCallback = std::function<void(std::string_view)>;

  explicit ChunkReader(Splitter splitter);      // uses default Config{}
  ChunkReader(Splitter splitter, Config cfg);
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Appends a chunk and emits every record that is now complete.
  bool feed(std::string_view chunk, const TokenCallback& cb);

  // End of stream: emits what the splitter still yields with at_eof set.
  // Bytes the splitter leaves behind are force-flushed when it was built
  // with flush_at_eof, otherwise they stay pending.
  bool finish(const TokenCallback& cb);

  // feed() the whole file in chunk_bytes pieces, then finish().
  bool for_each_token(const std::string& path, const TokenCallback& cb);

  const std::string& error() const noexcept;
  int  last_error() const noexcept;             // errno of the last I/O failure
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t tokens() const noexcept;
  std::uint64_t truncated() const noexcept;     // records cut at max_record_bytes
  std::uint64_t dropped_bytes() const noexcept; // bytes discarded by drop_oversize
  std::size_t   pending_bytes() const noexcept; // buffered, not yet emitted

private:
  struct Impl; Impl* p_;
};

}
