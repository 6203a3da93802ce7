#pragma once
#include <string>

namespace ss {

enum class ErrorKind { None, Config, Encoding, UnknownEncoding, Internal };

// Filled by the builders when they fail. A failed build is final: the stream
// does not start and nothing is retried.
struct BuildError {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  bool ok() const noexcept { return kind == ErrorKind::None; }
};

const char* error_kind_name(ErrorKind k) noexcept;

// Sets *err (if non-null) and returns false; keeps builder bodies short.
bool fail(BuildError* err, ErrorKind kind, std::string message);

}
