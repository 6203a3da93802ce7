#include "stream_splitter/delimiters.hpp"

namespace ss {

std::optional<EncodedDelimiters> resolve_delimiters(const Codec& codec, BuildError* err) {
  EncodedDelimiters d;
  std::string why;
  if (!codec.encode("\n", d.newline, &why)) {
    fail(err, ErrorKind::Encoding, "encode newline: " + why);
    return std::nullopt;
  }
  if (!codec.encode("\r", d.carriage_return, &why)) {
    fail(err, ErrorKind::Encoding, "encode carriage return: " + why);
    return std::nullopt;
  }
  if (d.newline.empty()) {
    fail(err, ErrorKind::Encoding, "codec '" + codec.name() + "' encodes newline as nothing");
    return std::nullopt;
  }
  return d;
}

}
