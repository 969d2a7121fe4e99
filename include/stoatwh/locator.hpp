#pragma once

#include <string>
#include <vector>

#include "stoatwh/common.hpp"

namespace stoatwh {

struct LocatorResult {
  bool ok{false};
  std::string url;
  std::string error;
};

inline bool looks_like_url(const std::string& s) {
  return starts_with(s, "http://") || starts_with(s, "https://");
}

// Accepts either a single full webhook URL or an <id> <token> pair.
inline LocatorResult resolve_locator(const std::vector<std::string>& args, const std::string& api_base) {
  LocatorResult out;
  if (args.size() == 1) {
    const std::string& arg = args[0];
    if (!looks_like_url(arg)) {
      out.error = "Error: single argument must be a full webhook URL.";
      return out;
    }
    out.ok = true;
    out.url = rstrip_char(arg, '/');
    return out;
  }
  if (args.size() == 2) {
    out.ok = true;
    out.url = rstrip_char(api_base, '/') + "/" + args[0] + "/" + args[1];
    return out;
  }
  out.error = "Error: provide either <url> or <id> <token>.";
  return out;
}

// Replaces the trailing token segment so URLs can be logged.
inline std::string redact_token(const std::string& url) {
  const auto slash = url.find_last_of('/');
  const auto scheme_end = url.find("://");
  if (slash == std::string::npos || (scheme_end != std::string::npos && slash <= scheme_end + 2) ||
      slash + 1 >= url.size()) {
    return url;
  }
  return url.substr(0, slash + 1) + "***";
}

}  // namespace stoatwh
