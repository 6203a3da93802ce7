#include "stream_splitter/codec.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iconv.h>
#include <utility>

namespace ss {

namespace {

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

const iconv_t kBadHandle = reinterpret_cast<iconv_t>(-1);
const std::size_t kIconvError = static_cast<std::size_t>(-1);

// RAII for iconv descriptors.
class IconvHandle {
public:
  IconvHandle(const char* to, const char* from) : cd_(iconv_open(to, from)) {}
  ~IconvHandle() { if (cd_ != kBadHandle) iconv_close(cd_); }
  IconvHandle(const IconvHandle&) = delete;
  IconvHandle& operator=(const IconvHandle&) = delete;

  bool valid() const noexcept { return cd_ != kBadHandle; }
  iconv_t get() const noexcept { return cd_; }

private:
  iconv_t cd_;
};

struct Override { const char* name; Codec::Kind kind; const char* charset; };

// Names that do not go through iconv, or that iconv would spell differently
// (plain "UTF-16" in iconv writes a BOM).
constexpr Override kOverrides[] = {
  {"",         Codec::Kind::Utf8,  "UTF-8"},
  {"utf-8",    Codec::Kind::Utf8,  "UTF-8"},
  {"utf8",     Codec::Kind::Utf8,  "UTF-8"},
  {"ascii",    Codec::Kind::Utf8,  "UTF-8"},
  {"us-ascii", Codec::Kind::Utf8,  "UTF-8"},
  {"utf-16",   Codec::Kind::Iconv, "UTF-16LE"},
  {"utf16",    Codec::Kind::Iconv, "UTF-16LE"},
  {"nop",      Codec::Kind::Nop,   ""},
};

}

Codec::Codec(Kind kind, std::string name, std::string charset)
  : kind_(kind), name_(std::move(name)), charset_(std::move(charset)) {}

Codec Codec::nop()  { return Codec(Kind::Nop, "nop", ""); }
Codec Codec::utf8() { return Codec(Kind::Utf8, "utf-8", "UTF-8"); }

bool Codec::encode(std::string_view utf8, std::string& out, std::string* err) const {
  out.clear();
  if (kind_ != Kind::Iconv) { out.assign(utf8.data(), utf8.size()); return true; }

  IconvHandle cd(charset_.c_str(), "UTF-8");
  if (!cd.valid()) {
    if (err) *err = "iconv_open(" + charset_ + "): " + std::strerror(errno);
    return false;
  }

  std::string in(utf8);
  char* inp = in.data();
  std::size_t in_left = in.size();
  char buf[64];

  while (in_left > 0) {
    char* outp = buf;
    std::size_t out_left = sizeof(buf);
    std::size_t rc = iconv(cd.get(), &inp, &in_left, &outp, &out_left);
    out.append(buf, sizeof(buf) - out_left);
    if (rc == kIconvError) {
      if (errno == E2BIG) continue;
      if (err) *err = "encode to " + charset_ + ": " + std::strerror(errno);
      return false;
    }
    if (rc > 0) { // irreversible substitution
      if (err) *err = "encode to " + charset_ + ": character not representable";
      return false;
    }
  }

  // Flush any pending shift sequence (stateful charsets).
  char* outp = buf;
  std::size_t out_left = sizeof(buf);
  if (iconv(cd.get(), nullptr, nullptr, &outp, &out_left) == kIconvError) {
    if (err) *err = "encode to " + charset_ + ": " + std::strerror(errno);
    return false;
  }
  out.append(buf, sizeof(buf) - out_left);
  return true;
}

std::optional<Codec> lookup_codec(std::string_view name, BuildError* err) {
  const std::string key = to_lower(name);
  for (const auto& o : kOverrides) {
    if (key == o.name) return Codec(o.kind, key, o.charset);
  }

  std::string charset(name);
  IconvHandle probe(charset.c_str(), "UTF-8");
  if (!probe.valid()) {
    fail(err, ErrorKind::UnknownEncoding, "unsupported encoding '" + charset + "'");
    return std::nullopt;
  }
  return Codec(Codec::Kind::Iconv, key, charset);
}

}
