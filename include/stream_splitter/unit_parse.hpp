#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ss {

// Duration strings as written in agent configs: a sequence of
// <decimal><unit> pairs, units ns|us|µs|ms|s|m|h ("500ms", "1.5s", "1m30s").
// A bare "0" is accepted. Negative values are rejected.
std::optional<std::chrono::nanoseconds> parse_duration(std::string_view s);

// Byte sizes: <decimal>[unit], unit case-insensitive among
// b|kb|kib|mb|mib|gb|gib (kb = 1000, kib = 1024). No unit means bytes.
std::optional<std::uint64_t> parse_byte_size(std::string_view s);

}
