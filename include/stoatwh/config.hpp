#pragma once

#include <string>

#include "stoatwh/common.hpp"

namespace stoatwh {

inline constexpr const char* kDefaultApiBase = "https://stoat.chat/api/webhooks";
inline constexpr const char* kApiBaseEnv = "STOAT_API";
inline constexpr const char* kLogJsonEnv = "STOATWH_LOG_JSON";
inline constexpr const char* kProjectUrl = "https://github.com/bjornmorten/stoat-wh";
inline constexpr const char* kVersion = "1.0";

struct Config {
  std::string api_base{kDefaultApiBase};
  int timeout_s{15};
  std::string user_agent{std::string("stoat-wh/") + kVersion + " (+" + kProjectUrl + ")"};
};

inline std::string env_or_empty(const char* name) {
  const char* v = std::getenv(name);
  return (v && *v) ? std::string(v) : "";
}

inline std::string api_base_from_env() {
  const std::string v = trim(env_or_empty(kApiBaseEnv));
  if (v.empty()) {
    return kDefaultApiBase;
  }
  return rstrip_char(v, '/');
}

inline bool log_json_from_env() {
  const std::string v = env_or_empty(kLogJsonEnv);
  return !v.empty() && v != "0";
}

inline Config load_config() {
  Config cfg{};
  cfg.api_base = api_base_from_env();
  return cfg;
}

}  // namespace stoatwh
