#pragma once
#include "stream_splitter/build_error.hpp"
#include "stream_splitter/codec.hpp"
#include <optional>
#include <string>

namespace ss {

// Byte spelling of '\n' and '\r' in a codec's charset (e.g. "\x00\x0a" for
// UTF-16BE). Resolved once per tokenizer and kept inside it.
struct EncodedDelimiters {
  std::string newline;
  std::string carriage_return;
};

// Fails with ErrorKind::Encoding if the codec cannot encode either character.
std::optional<EncodedDelimiters> resolve_delimiters(const Codec& codec, BuildError* err = nullptr);

}
