#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace stoatwh {

using json = nlohmann::json;
namespace fs = std::filesystem;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitNetwork = 2;
constexpr int kExitBadResponse = 3;
constexpr int kExitParse = 5;
constexpr int kExitValidation = 6;
constexpr int kExitInterrupted = 130;

inline std::string trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

inline std::string rstrip_char(std::string s, char c) {
  while (!s.empty() && s.back() == c) {
    s.pop_back();
  }
  return s;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline std::optional<std::string> read_text_file(const fs::path& p) {
  std::ifstream in(p, std::ios::in | std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline std::string now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

// Formats 128 bits as a version-4, variant-1 UUID in canonical lowercase form.
inline std::string uuid_v4_from_words(const std::array<std::uint32_t, 4>& w) {
  std::uint64_t hi = (static_cast<std::uint64_t>(w[0]) << 32) | w[1];
  std::uint64_t lo = (static_cast<std::uint64_t>(w[2]) << 32) | w[3];
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::ostringstream ss;
  ss << std::hex << std::setfill('0') << std::setw(8) << (hi >> 32) << '-' << std::setw(4)
     << ((hi >> 16) & 0xFFFF) << '-' << std::setw(4) << (hi & 0xFFFF) << '-' << std::setw(4) << (lo >> 48)
     << '-' << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
  return ss.str();
}

// Every word comes straight from std::random_device, so keys minted by
// separate processes do not share a seed space.
inline std::string uuid_v4() {
  std::random_device rd;
  std::array<std::uint32_t, 4> w{};
  for (auto& x : w) {
    x = static_cast<std::uint32_t>(rd());
  }
  return uuid_v4_from_words(w);
}

class Logger {
 public:
  enum class Level { kInfo, kWarn, kError, kDebug };

  static void set_json(bool enabled) { json_mode().store(enabled); }
  static void set_min_level(Level level) { min_level() = level; }

  static void log(Level level, const std::string& msg) {
    if (level_rank(level) < level_rank(min_level())) {
      return;
    }
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    if (json_mode().load()) {
      json j;
      j["time"] = now_iso8601();
      j["level"] = level_name(level);
      j["msg"] = msg;
      std::cerr << j.dump() << "\n";
    } else {
      std::cerr << "[" << level_name(level) << "] " << msg << "\n";
    }
  }

 private:
  static int level_rank(Level level) {
    switch (level) {
      case Level::kDebug:
        return 0;
      case Level::kInfo:
        return 1;
      case Level::kWarn:
        return 2;
      case Level::kError:
      default:
        return 3;
    }
  }

  static std::atomic<bool>& json_mode() {
    static std::atomic<bool> v{false};
    return v;
  }

  static Level& min_level() {
    static Level v = Level::kWarn;
    return v;
  }

  static const char* level_name(Level level) {
    switch (level) {
      case Level::kInfo:
        return "INFO";
      case Level::kWarn:
        return "WARN";
      case Level::kError:
        return "ERROR";
      case Level::kDebug:
      default:
        return "DEBUG";
    }
  }
};

}  // namespace stoatwh
