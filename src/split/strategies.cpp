#include "stream_splitter/strategies.hpp"

namespace ss {

namespace {

struct Match { std::size_t begin; std::size_t end; };

// First match of `re` in data[from:], offsets relative to `data`. The search
// text starts at `from`, so '^' also matches there.
std::optional<Match> find_match(const re2::RE2& re, std::string_view data, std::size_t from) {
  const re2::StringPiece text(data.data() + from, data.size() - from);
  re2::StringPiece m;
  if (!re.Match(text, 0, text.size(), re2::RE2::UNANCHORED, &m, 1)) return std::nullopt;
  const auto pos = from + static_cast<std::size_t>(m.data() - text.data());
  return Match{pos, pos + m.size()};
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Emits everything that is left when the stream is over.
bool flush_all(std::string_view data, bool at_eof, bool flush_at_eof, TrimFunc trim, SplitResult& r) {
  if (data.empty() || !at_eof || !flush_at_eof) return false;
  r.token = trim(data);
  r.advance = data.size();
  return true;
}

}

SplitResult NoSplit::next(std::string_view data, bool at_eof) const {
  SplitResult r;
  if (data.size() >= max_log_size) {
    r.token = data.substr(0, max_log_size);
    r.advance = max_log_size;
    return r;
  }
  if (!at_eof || data.empty()) return r;
  r.token = data;
  r.advance = data.size();
  return r;
}

SplitResult NewlineSplit::next(std::string_view data, bool at_eof) const {
  SplitResult r;
  if (at_eof && data.empty()) return r;

  const auto i = data.find(newline);
  if (i != std::string_view::npos) {
    std::string_view line = data.substr(0, i);
    if (!carriage_return.empty() && ends_with(line, carriage_return))
      line.remove_suffix(carriage_return.size());
    r.token = trim(line);
    r.advance = i + newline.size();
    return r;
  }

  flush_all(data, at_eof, flush_at_eof, trim, r);
  return r;
}

SplitResult LineStartSplit::next(std::string_view data, bool at_eof) const {
  SplitResult r;
  const std::optional<Match> first = find_match(*re, data, 0);
  if (!first) {
    flush_all(data, at_eof, flush_at_eof, trim, r);
    return r;
  }

  // Bytes ahead of the first record start go out on their own so nothing is
  // lost, unless they are only whitespace.
  if (first->begin != 0) {
    std::string_view prefix = trim(data.substr(0, first->begin));
    if (!prefix.empty()) {
      r.token = prefix;
      r.advance = first->begin;
      return r;
    }
  }

  // A match touching the end of the buffer may still grow; wait, even at EOF.
  if (first->end == data.size()) return r;

  if (flush_all(data, at_eof, flush_at_eof, trim, r)) return r;

  const std::optional<Match> second = find_match(*re, data, first->end + 1);
  if (!second) return r;

  r.token = trim(data.substr(first->begin, second->begin - first->begin));
  r.advance = second->begin;
  return r;
}

SplitResult LineEndSplit::next(std::string_view data, bool at_eof) const {
  SplitResult r;
  const std::optional<Match> m = find_match(*re, data, 0);
  if (!m) {
    flush_all(data, at_eof, flush_at_eof, trim, r);
    return r;
  }

  // Match ending one byte short of the buffer end: read more before cutting.
  if (m->end == data.size() - 1 && !at_eof) return r;

  r.token = trim(data.substr(0, m->end));
  r.advance = m->end;
  return r;
}

const char* strategy_name(const Strategy& s) noexcept {
  switch (s.index()) {
    case 0: return "nosplit";
    case 1: return "newline";
    case 2: return "line_start";
    case 3: return "line_end";
  }
  return "unknown";
}

Regex compile_multiline(const std::string& pattern, std::string* err_out) {
  re2::RE2::Options opts;
  opts.set_log_errors(false);
  auto re = std::make_shared<const re2::RE2>("(?m)" + pattern, opts);
  if (!re->ok()) {
    if (err_out) *err_out = re->error();
    return nullptr;
  }
  return re;
}

}
