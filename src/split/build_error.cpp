#include "stream_splitter/build_error.hpp"
#include <utility>

namespace ss {

const char* error_kind_name(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:            return "none";
    case ErrorKind::Config:          return "config";
    case ErrorKind::Encoding:        return "encoding";
    case ErrorKind::UnknownEncoding: return "unknown_encoding";
    case ErrorKind::Internal:        return "internal";
  }
  return "internal";
}

bool fail(BuildError* err, ErrorKind kind, std::string message) {
  if (err) { err->kind = kind; err->message = std::move(message); }
  return false;
}

}
