#include "stream_splitter/strategies.hpp"
#include "stream_splitter/trim.hpp"

#include <re2/re2.h>
#include <iostream>
#include <string>
#include <string_view>

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static bool is_token(const ss::SplitResult& r, std::string_view tok, std::size_t advance) {
  return r.err.empty() && r.token && *r.token == tok && r.advance == advance;
}

static void line_start_cases() {
  ss::LineStartSplit s{ss::compile_multiline("START"), true, &ss::trim_both};

  const std::string data = "START a\nmiddle\nSTART b\n";
  ss::SplitResult r = s.next(data, false);
  expect(is_token(r, "START a\nmiddle", 15), "first record runs up to the next start");

  std::string_view rest = std::string_view(data).substr(r.advance);
  r = s.next(rest, false);
  expect(r.need_more(), "last record waits for another start");
  r = s.next(rest, true);
  expect(is_token(r, "START b", 8), "last record flushed at EOF");

  // content ahead of the first start is its own record
  r = s.next("junk\nSTART a\nSTART b", false);
  expect(is_token(r, "junk", 5), "unmatched prefix emitted alone");

  // whitespace-only prefix is not a record; it is swallowed by the next one
  r = s.next(" \nSTART a\nSTART b\n", false);
  expect(is_token(r, "START a", 10), "whitespace prefix falls through");

  // with whitespace preserved the same prefix is a record
  ss::LineStartSplit keep{ss::compile_multiline("START"), true, &ss::no_trim};
  r = keep.next(" \nSTART a\nSTART b\n", false);
  expect(is_token(r, " \n", 2), "preserved whitespace prefix emitted");

  // a match reaching the buffer end waits, even at EOF
  r = s.next("START", true);
  expect(r.need_more(), "match touching the end is never flushed");

  // no match at all
  r = s.next("nothing here", false);
  expect(r.need_more(), "no start pattern yet");
  r = s.next("nothing here", true);
  expect(is_token(r, "nothing here", 12), "no start pattern, flushed at EOF");
  ss::LineStartSplit no_flush{ss::compile_multiline("START"), false, &ss::trim_both};
  r = no_flush.next("nothing here", true);
  expect(r.need_more(), "no flush when disabled");
  r = no_flush.next("START a\nSTART b", true);
  expect(is_token(r, "START a", 8), "records still split at EOF without flush");

  // '^' anchors at embedded line starts
  ss::LineStartSplit anchored{ss::compile_multiline("^START"), true, &ss::trim_both};
  r = anchored.next("xSTART\nSTART 1\nSTART 2\n", false);
  expect(is_token(r, "xSTART", 7), "mid-line START is not a record start");
  r = anchored.next("START 1\nSTART 2\n", false);
  expect(is_token(r, "START 1", 8), "anchored start at line boundary");
}

static void line_end_cases() {
  ss::LineEndSplit s{ss::compile_multiline(";"), true, &ss::trim_both};

  const std::string data = "lineA;lineB;";
  ss::SplitResult r = s.next(data, false);
  expect(is_token(r, "lineA;", 6), "record ends with its terminator");
  std::string_view rest = std::string_view(data).substr(r.advance);
  r = s.next(rest, false);
  expect(is_token(r, "lineB;", 6), "second record");

  // terminator one byte short of the buffer end: wait unless at EOF
  r = s.next("lineA;x", false);
  expect(r.need_more(), "match ending at len-1 waits");
  r = s.next("lineA;x", true);
  expect(is_token(r, "lineA;", 6), "match ending at len-1 cut at EOF");

  r = s.next("no terminator", false);
  expect(r.need_more(), "no terminator yet");
  r = s.next("no terminator", true);
  expect(is_token(r, "no terminator", 13), "unterminated tail flushed at EOF");

  // '$' anchors before embedded newlines
  ss::LineEndSplit anchored{ss::compile_multiline("end$"), true, &ss::trim_both};
  r = anchored.next("a\nend\nb\n", false);
  expect(is_token(r, "a\nend", 5), "record ends at end-of-line match");
  r = anchored.next("\nb\n", true);
  expect(is_token(r, "b", 3), "tail after the last terminator");
}

static void regex_flavour() {
  ss::Regex re = ss::compile_multiline("a.b");
  expect(re != nullptr, "pattern compiles");
  expect(!re2::RE2::PartialMatch("a\nb", *re), "'.' does not cross a newline");
  expect(re2::RE2::PartialMatch("a-b", *re), "'.' matches other bytes");

  std::string why;
  expect(ss::compile_multiline("(unclosed", &why) == nullptr, "bad syntax rejected");
  expect(!why.empty(), "bad syntax explained");
}

// Only '\n' separates lines; a lone '\r' is ordinary content.
static void carriage_returns() {
  ss::LineStartSplit digit{ss::compile_multiline("^\\d"), true, &ss::trim_both};
  ss::SplitResult r = digit.next("1 a\r2 b\n3 c\n", false);
  expect(is_token(r, "1 a\r2 b", 8), "no record start after a bare CR");

  ss::LineEndSplit brace{ss::compile_multiline("\\}$"), true, &ss::trim_both};
  r = brace.next("{a}\r\n{b}\r\n", false);
  expect(r.need_more(), "'$' does not match before the CR of CRLF");
  r = brace.next("{a}\r\n{b}\r\n", true);
  expect(is_token(r, "{a}\r\n{b}", 10), "CRLF input without a match flushed at EOF");
}

// Nested quantifiers run in linear time and never fail the call.
static void nested_quantifiers() {
  ss::LineEndSplit s{ss::compile_multiline("^(a+)+$"), true, &ss::trim_both};
  const std::string data = std::string(40, 'a') + "b\n";
  ss::SplitResult r = s.next(data, false);
  expect(r.need_more() && r.err.empty(), "no match, no error");
  r = s.next(data, true);
  expect(is_token(r, std::string(40, 'a') + "b", data.size()), "flushed at EOF");

  ss::LineEndSplit hit{ss::compile_multiline("^(a+)+$"), true, &ss::trim_both};
  const std::string ok = std::string(40, 'a') + "\nnext";
  r = hit.next(ok, false);
  expect(is_token(r, std::string(40, 'a'), 40), "long run of a matched");
}

int main(){
  line_start_cases();
  line_end_cases();
  regex_flavour();
  carriage_returns();
  nested_quantifiers();

  if (failures) return 1;
  std::cout << "[PASS] pattern split\n";
  return 0;
}
