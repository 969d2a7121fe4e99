#pragma once

#include <optional>
#include <string>

#include "stoatwh/common.hpp"

namespace stoatwh {

// ok=false carries a message naming the offending value. ok=true with no value
// means the input was empty.
struct JsonSourceResult {
  bool ok{true};
  std::optional<json> value;
  std::string error;
};

inline std::string quote_value(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

inline std::string json_error_detail(const json::parse_error& e) {
  const std::string what = e.what();
  // "[json.exception.parse_error.101] parse error at line 1, column 2: ..."
  const auto bracket = what.find("] ");
  return bracket == std::string::npos ? what : what.substr(bracket + 2);
}

inline bool is_existing_file(const std::string& value) {
  std::error_code ec;
  return fs::is_regular_file(fs::path(value), ec);
}

// A value is either a path to a JSON file or an inline JSON literal. The
// filesystem is probed first.
inline JsonSourceResult resolve_json_source(const std::optional<std::string>& value) {
  JsonSourceResult out;
  if (!value.has_value() || value->empty()) {
    return out;
  }

  if (is_existing_file(*value)) {
    const auto raw = read_text_file(*value);
    if (!raw.has_value()) {
      out.ok = false;
      out.error = quote_value(*value) + " could not be read";
      return out;
    }
    try {
      out.value = json::parse(*raw);
    } catch (const json::parse_error& e) {
      out.ok = false;
      out.error = quote_value(*value) + " is not a valid JSON file: " + json_error_detail(e);
    }
    return out;
  }

  try {
    out.value = json::parse(*value);
  } catch (const json::parse_error& e) {
    out.ok = false;
    out.error = quote_value(*value) + " is neither a JSON file nor valid JSON: " + json_error_detail(e);
  }
  return out;
}

}  // namespace stoatwh
