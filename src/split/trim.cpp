#include "stream_splitter/trim.hpp"

namespace ss {

static constexpr std::string_view kWhitespace = "\r\n\t ";

std::string_view no_trim(std::string_view s) noexcept { return s; }

std::string_view trim_leading(std::string_view s) noexcept {
  auto pos = s.find_first_not_of(kWhitespace);
  if (pos == std::string_view::npos) return s.substr(s.size()); // empty, same base
  return s.substr(pos);
}

std::string_view trim_trailing(std::string_view s) noexcept {
  auto pos = s.find_last_not_of(kWhitespace);
  if (pos == std::string_view::npos) return s.substr(0, 0);
  return s.substr(0, pos + 1);
}

std::string_view trim_both(std::string_view s) noexcept {
  return trim_leading(trim_trailing(s));
}

TrimFunc select_trim(bool preserve_leading, bool preserve_trailing) noexcept {
  if (preserve_leading && preserve_trailing) return &no_trim;
  if (preserve_leading) return &trim_trailing;
  if (preserve_trailing) return &trim_leading;
  return &trim_both;
}

}
