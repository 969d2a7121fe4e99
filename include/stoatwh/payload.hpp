#pragma once

#include <optional>
#include <string>
#include <vector>

#include "stoatwh/common.hpp"
#include "stoatwh/json_source.hpp"

namespace stoatwh {

struct SendOptions {
  std::optional<std::string> content;
  std::optional<std::string> username;
  std::optional<std::string> avatar;
  std::optional<long long> flags;
  std::vector<std::string> replies;
  // Only a single embed is currently honoured by the API; extra entries are
  // still resolved and forwarded.
  std::vector<std::string> embeds;
  std::optional<std::string> interactions;
};

struct PayloadResult {
  bool ok{false};
  int exit_code{kExitOk};
  std::string error;
  json message{json::object()};
};

inline std::optional<std::string> non_empty(const std::optional<std::string>& s) {
  if (s.has_value() && !s->empty()) {
    return s;
  }
  return std::nullopt;
}

// Piped stdin, trimmed, wins over --content. Keys are only added when their
// input is present.
inline PayloadResult build_message(const SendOptions& opts, const std::optional<std::string>& stdin_text) {
  PayloadResult out;

  std::optional<std::string> text;
  if (stdin_text.has_value()) {
    const std::string piped = trim(*stdin_text);
    if (!piped.empty()) {
      text = piped;
    }
  }
  if (!text.has_value()) {
    text = non_empty(opts.content);
  }

  if (!text.has_value() && opts.embeds.empty()) {
    out.exit_code = kExitValidation;
    out.error = "Error: need content, stdin, or embeds.";
    return out;
  }

  json& msg = out.message;
  if (text.has_value()) {
    msg["content"] = *text;
  }
  if (opts.flags.has_value()) {
    msg["flags"] = *opts.flags;
  }
  if (!opts.replies.empty()) {
    json replies = json::array();
    for (const auto& id : opts.replies) {
      replies.push_back({{"id", id}, {"mention", false}});
    }
    msg["replies"] = std::move(replies);
  }
  if (!opts.embeds.empty()) {
    json embeds = json::array();
    for (const auto& e : opts.embeds) {
      JsonSourceResult r = resolve_json_source(e);
      if (!r.ok) {
        out.exit_code = kExitParse;
        out.error = "Error parsing embed: " + r.error;
        return out;
      }
      embeds.push_back(r.value.has_value() ? std::move(*r.value) : json(nullptr));
    }
    msg["embeds"] = std::move(embeds);
  }
  if (non_empty(opts.interactions).has_value()) {
    JsonSourceResult r = resolve_json_source(opts.interactions);
    if (!r.ok) {
      out.exit_code = kExitParse;
      out.error = "Error parsing interactions: " + r.error;
      return out;
    }
    msg["interactions"] = std::move(*r.value);
  }

  const auto username = non_empty(opts.username);
  const auto avatar = non_empty(opts.avatar);
  if (username.has_value() || avatar.has_value()) {
    json masquerade = json::object();
    if (username.has_value()) {
      masquerade["name"] = *username;
    }
    if (avatar.has_value()) {
      masquerade["avatar"] = *avatar;
    }
    msg["masquerade"] = std::move(masquerade);
  }

  out.ok = true;
  return out;
}

}  // namespace stoatwh
