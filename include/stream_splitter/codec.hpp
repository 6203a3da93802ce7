#pragma once
#include "stream_splitter/build_error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace ss {

// A named character encoding. Only the encode direction is needed here: the
// splitter works on raw bytes and only has to know how the configured charset
// spells a few control characters.
class Codec {
public:
  enum class Kind {
    Nop,   // raw passthrough, no character set at all
    Utf8,  // identity transform
    Iconv  // anything the system iconv knows
  };

  Codec(Kind kind, std::string name, std::string charset);

  static Codec nop();
  static Codec utf8();

  Kind kind() const noexcept { return kind_; }
  bool is_nop() const noexcept { return kind_ == Kind::Nop; }

  // Name as looked up (lowercased) and the charset handed to iconv.
  const std::string& name() const noexcept { return name_; }
  const std::string& charset() const noexcept { return charset_; }

  // UTF-8 text -> bytes in this charset. Fails if the charset cannot
  // represent some input character.
  bool encode(std::string_view utf8, std::string& out, std::string* err = nullptr) const;

private:
  Kind kind_;
  std::string name_;
  std::string charset_;
};

// Case-insensitive lookup. "", "utf-8", "utf8", "ascii", "us-ascii" map to
// UTF-8; "utf-16"/"utf16" to little endian UTF-16 without BOM; "nop" to raw
// passthrough. Other names go to iconv. Unknown -> ErrorKind::UnknownEncoding.
std::optional<Codec> lookup_codec(std::string_view name, BuildError* err = nullptr);

}
