#include "stream_splitter/unit_parse.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <system_error>
#include <fast_float/fast_float.h>

namespace ss {

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

static std::string_view strip(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
  return s;
}

// Parses a non-negative decimal (no exponent) at the front of `s`; returns
// chars used or 0.
static std::size_t parse_decimal(std::string_view s, double& out) {
  if (s.empty() || !(is_digit(s.front()) || s.front() == '.')) return 0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out,
                                         fast_float::chars_format::fixed);
  if (ec != std::errc() || !std::isfinite(out)) return 0;
  return static_cast<std::size_t>(ptr - s.data());
}

static double duration_unit_ns(std::string_view u) {
  if (u == "ns") return 1.0;
  if (u == "us" || u == "\xC2\xB5s" || u == "\xCE\xBCs") return 1e3; // us, micro sign, greek mu
  if (u == "ms") return 1e6;
  if (u == "s")  return 1e9;
  if (u == "m")  return 60e9;
  if (u == "h")  return 3600e9;
  return 0.0;
}

std::optional<std::chrono::nanoseconds> parse_duration(std::string_view s) {
  s = strip(s);
  if (s.empty()) return std::nullopt;
  if (s == "0") return std::chrono::nanoseconds(0);

  double total = 0.0;
  while (!s.empty()) {
    double v = 0.0;
    std::size_t n = parse_decimal(s, v);
    if (n == 0) return std::nullopt;
    s.remove_prefix(n);

    std::size_t u = 0;
    while (u < s.size() && !is_digit(s[u]) && s[u] != '.') ++u;
    double scale = duration_unit_ns(s.substr(0, u));
    if (scale == 0.0) return std::nullopt; // missing or unknown unit
    s.remove_prefix(u);
    total += v * scale;
  }

  if (total > 9.2e18) return std::nullopt; // int64 nanoseconds overflow
  return std::chrono::nanoseconds(static_cast<std::int64_t>(std::llround(total)));
}

std::optional<std::uint64_t> parse_byte_size(std::string_view s) {
  s = strip(s);
  double v = 0.0;
  std::size_t n = parse_decimal(s, v);
  if (n == 0) return std::nullopt;

  std::string unit(strip(s.substr(n)));
  std::transform(unit.begin(), unit.end(), unit.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  double scale = 0.0;
  if (unit.empty() || unit == "b") scale = 1.0;
  else if (unit == "kb")  scale = 1e3;
  else if (unit == "kib") scale = 1024.0;
  else if (unit == "mb")  scale = 1e6;
  else if (unit == "mib") scale = 1024.0 * 1024.0;
  else if (unit == "gb")  scale = 1e9;
  else if (unit == "gib") scale = 1024.0 * 1024.0 * 1024.0;
  else return std::nullopt;

  double bytes = v * scale;
  if (bytes > 1.8e19) return std::nullopt;
  return static_cast<std::uint64_t>(bytes + 0.5);
}

}
