#include "stream_splitter/chunk_reader.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>
#include <vector>

namespace ss {

// Same bound bufio.Scanner-style loops use before giving up on a splitter
// that keeps returning empty tokens without consuming anything.
static constexpr int kMaxEmptyTokens = 100;

struct ChunkReader::Impl {
  Splitter splitter;
  Config cfg;
  std::string buf;
  std::size_t head{0};
  std::string err;
  int last_errno{0};
  std::uint64_t bytes{0};
  std::uint64_t ntokens{0};
  std::uint64_t ntruncated{0};
  std::uint64_t ndropped{0};

  Impl(Splitter s, Config c) : splitter(std::move(s)), cfg(c) {}

  std::string_view pending() const { return std::string_view(buf).substr(head); }

  void emit(std::string_view tok, const TokenCallback& cb) {
    ++ntokens;
    cb(tok);
  }

  // No boundary within max_record_bytes: cut (or drop) a guard-sized record.
  void cut_oversize(std::string_view data, const TokenCallback& cb) {
    std::string_view part = data.substr(0, cfg.max_record_bytes);
    if (cfg.drop_oversize) {
      ndropped += part.size();
    } else {
      ++ntruncated;
      emit(splitter.tokenizer().trim(part), cb);
    }
    head += part.size();
  }

  bool drain(bool at_eof, const TokenCallback& cb) {
    int empty_tokens = 0;
    while (true) {
      std::string_view data = pending();
      if (data.empty() && !at_eof) break;

      SplitResult r = splitter.next(data, at_eof);
      if (r.failed()) { err = r.err; return false; }
      if (r.advance > data.size()) { err = "splitter advanced past the end of the buffer"; return false; }

      if (r.token) emit(*r.token, cb);

      if (r.advance == 0) {
        if (r.token) {
          if (++empty_tokens > kMaxEmptyTokens) {
            err = "too many empty tokens without progressing";
            return false;
          }
          continue;
        }
        if (cfg.max_record_bytes > 0 && data.size() >= cfg.max_record_bytes) {
          cut_oversize(data, cb);
          continue;
        }
        break; // need more data
      }

      empty_tokens = 0;
      head += r.advance;
    }
    compact();
    return true;
  }

  void compact() {
    if (head == 0) return;
    if (head >= buf.size()) { buf.clear(); head = 0; return; }
    if (head >= buf.size() / 2) { buf.erase(0, head); head = 0; }
  }

  bool feed(std::string_view chunk, const TokenCallback& cb) {
    bytes += chunk.size();
    buf.append(chunk.data(), chunk.size());
    return drain(false, cb);
  }

  bool finish(const TokenCallback& cb) {
    if (!drain(true, cb)) return false;
    std::string_view rest = pending();
    if (!rest.empty() && splitter.tokenizer().flush_at_eof()) {
      emit(splitter.tokenizer().trim(rest), cb);
      head += rest.size();
      compact();
    }
    return true;
  }

  bool for_each_token(const std::string& path, const TokenCallback& cb) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; err = "open " + path + ": " + std::strerror(last_errno); return false; }

    std::vector<char> chunk(cfg.chunk_bytes > 0 ? cfg.chunk_bytes : 1);
    while (true) {
      std::size_t n = std::fread(chunk.data(), 1, chunk.size(), f);
      if (n == 0 && std::ferror(f)) {
        last_errno = errno;
        err = "read " + path + ": " + std::strerror(last_errno);
        std::fclose(f);
        return false;
      }
      if (n == 0 && std::feof(f)) break;
      if (!feed(std::string_view(chunk.data(), n), cb)) { std::fclose(f); return false; }
    }

    std::fclose(f);
    return finish(cb);
  }
};

ChunkReader::ChunkReader(Splitter splitter)
  : ChunkReader(std::move(splitter), Config{}) {}

ChunkReader::ChunkReader(Splitter splitter, Config cfg)
  : p_(new Impl(std::move(splitter), cfg)) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::feed(std::string_view chunk, const TokenCallback& cb) { return p_->feed(chunk, cb); }
bool ChunkReader::finish(const TokenCallback& cb) { return p_->finish(cb); }
bool ChunkReader::for_each_token(const std::string& path, const TokenCallback& cb) { return p_->for_each_token(path, cb); }

const std::string& ChunkReader::error() const noexcept { return p_->err; }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::tokens() const noexcept { return p_->ntokens; }
std::uint64_t ChunkReader::truncated() const noexcept { return p_->ntruncated; }
std::uint64_t ChunkReader::dropped_bytes() const noexcept { return p_->ndropped; }
std::size_t   ChunkReader::pending_bytes() const noexcept { return p_->buf.size() - p_->head; }

}
