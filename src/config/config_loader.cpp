#include "stream_splitter/config_loader.hpp"
#include "stream_splitter/unit_parse.hpp"

#include <simdjson.h>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace ss {

namespace {

using simdjson::ondemand::json_type;

bool set_err(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

bool read_duration(simdjson::ondemand::value v, std::string_view key,
                   std::chrono::nanoseconds& out, std::string* err_out) {
  if (v.type().value() == json_type::number) {
    double ms = v.get_double().value();
    if (!(ms >= 0.0) || !std::isfinite(ms))
      return set_err(err_out, std::string(key) + ": negative or invalid duration");
    if (ms > 9.2e12) // int64 nanoseconds overflow
      return set_err(err_out, std::string(key) + ": duration out of range");
    out = std::chrono::nanoseconds(static_cast<std::int64_t>(ms * 1e6));
    return true;
  }
  std::string_view s = v.get_string().value();
  auto d = parse_duration(s);
  if (!d) return set_err(err_out, std::string(key) + ": invalid duration '" + std::string(s) + "'");
  out = *d;
  return true;
}

bool read_size(simdjson::ondemand::value v, std::string_view key,
               std::size_t& out, std::string* err_out) {
  if (v.type().value() == json_type::number) {
    out = static_cast<std::size_t>(v.get_uint64().value());
    return true;
  }
  std::string_view s = v.get_string().value();
  auto n = parse_byte_size(s);
  if (!n) return set_err(err_out, std::string(key) + ": invalid size '" + std::string(s) + "'");
  out = static_cast<std::size_t>(*n);
  return true;
}

bool read_multiline(simdjson::ondemand::value v, MultilineConfig& out, std::string* err_out) {
  simdjson::ondemand::object obj = v.get_object();
  for (auto field : obj) {
    std::string_view key = field.unescaped_key().value();
    simdjson::ondemand::value fv = field.value();
    if (key == "line_start_pattern") {
      out.line_start_pattern = std::string(fv.get_string().value());
    } else if (key == "line_end_pattern") {
      out.line_end_pattern = std::string(fv.get_string().value());
    } else {
      return set_err(err_out, "unknown key 'multiline." + std::string(key) + "'");
    }
  }
  return true;
}

bool read_document(simdjson::padded_string& json, ReaderSettings& out, std::string* err_out) {
  ReaderSettings s;
  try {
    simdjson::ondemand::parser parser;
    simdjson::ondemand::document doc = parser.iterate(json);
    simdjson::ondemand::object root = doc.get_object();

    for (auto field : root) {
      std::string key(field.unescaped_key().value());
      simdjson::ondemand::value v = field.value();

      if (key == "encoding") {
        s.splitter.encoding = std::string(v.get_string().value());
      } else if (key == "multiline") {
        if (!read_multiline(v, s.splitter.multiline, err_out)) return false;
      } else if (key == "preserve_leading_whitespaces") {
        s.splitter.preserve_leading_whitespaces = v.get_bool().value();
      } else if (key == "preserve_trailing_whitespaces") {
        s.splitter.preserve_trailing_whitespaces = v.get_bool().value();
      } else if (key == "force_flush_period") {
        if (!read_duration(v, key, s.splitter.flusher.period, err_out)) return false;
      } else if (key == "max_log_size") {
        if (!read_size(v, key, s.max_log_size, err_out)) return false;
      } else if (key == "flush_at_eof") {
        s.flush_at_eof = v.get_bool().value();
      } else if (key == "chunk_bytes") {
        if (!read_size(v, key, s.chunk_bytes, err_out)) return false;
        if (s.chunk_bytes == 0) return set_err(err_out, "chunk_bytes must be greater than zero");
      } else {
        return set_err(err_out, "unknown key '" + key + "'");
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    return set_err(err_out, std::string("invalid config: ") + e.what());
  }

  out = std::move(s);
  return true;
}

}

bool load_settings_json(std::string_view json, ReaderSettings& out, std::string* err_out) {
  simdjson::padded_string padded(json);
  return read_document(padded, out, err_out);
}

bool load_settings_file(const std::string& path, ReaderSettings& out, std::string* err_out) {
  simdjson::padded_string json;
  if (auto ec = simdjson::padded_string::load(path).get(json)) {
    return set_err(err_out, "read " + path + ": " + simdjson::error_message(ec));
  }
  if (!read_document(json, out, err_out)) {
    if (err_out) *err_out = path + ": " + *err_out;
    return false;
  }
  return true;
}

}
