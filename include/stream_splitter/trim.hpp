#pragma once
#include <string_view>

namespace ss {

// Trimming works on the class {'\r', '\n', '\t', ' '}. An all-whitespace
// input trims to an empty (never absent) view.
using TrimFunc = std::string_view (*)(std::string_view);

std::string_view no_trim(std::string_view s) noexcept;
std::string_view trim_leading(std::string_view s) noexcept;
std::string_view trim_trailing(std::string_view s) noexcept;
std::string_view trim_both(std::string_view s) noexcept;

TrimFunc select_trim(bool preserve_leading, bool preserve_trailing) noexcept;

}
