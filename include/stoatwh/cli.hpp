#pragma once

#include <optional>
#include <string>
#include <vector>

#include "stoatwh/common.hpp"
#include "stoatwh/payload.hpp"

namespace stoatwh {

struct CliOptions {
  std::string command;
  std::vector<std::string> positionals;
  bool debug{false};
  bool help{false};
  bool version{false};
  bool json_output{false};
  std::optional<std::string> name;
  SendOptions send{};
};

struct CliParseResult {
  bool ok{false};
  std::string error;
  CliOptions options{};
};

inline std::string usage_text() {
  return "stoat-wh - manage and send messages via Stoat webhooks\n\n"
         "Usage:\n"
         "  stoat-wh get (<url> | <id> <token>) [--json]\n"
         "  stoat-wh edit (<url> | <id> <token>) [--name NAME]\n"
         "  stoat-wh delete (<url> | <id> <token>)\n"
         "  stoat-wh send (<url> | <id> <token>) [options]\n\n"
         "Options for 'send':\n"
         "  -c, --content TEXT         Message content (overridden by stdin if piped)\n"
         "  --username NAME            Masquerade display name\n"
         "  --avatar URL               Masquerade avatar URL\n"
         "  --flags INT                Message flag bitfield\n"
         "  --reply ID [ID ...]        Message IDs to reply to\n"
         "  --embed PATH|JSON [...]    Embed JSON string or file path (only one supported)\n"
         "  --interactions PATH|JSON   Interactions JSON string or file path\n\n"
         "Global options:\n"
         "  --debug                    Show raw API output and full error JSON\n"
         "  -h, --help                 Show this help\n"
         "  --version                  Show version\n\n"
         "Environment:\n"
         "  STOAT_API                  Override base API endpoint (default: https://stoat.chat/api/webhooks)\n"
         "  STOATWH_LOG_JSON           Emit diagnostic log lines as JSON\n";
}

inline bool is_known_command(const std::string& c) {
  return c == "get" || c == "edit" || c == "delete" || c == "send";
}

inline bool option_allowed(const std::string& command, const std::string& opt) {
  if (opt == "--json") {
    return command == "get";
  }
  if (opt == "--name") {
    return command == "edit";
  }
  return command == "send";
}

inline std::optional<long long> parse_int(const std::string& raw) {
  const std::string s = trim(raw);
  if (s.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t used = 0;
    const long long v = std::stoll(s, &used, 10);
    if (used != s.size()) {
      return std::nullopt;
    }
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// Options may be interleaved with positionals. --reply and --embed take every
// following token that does not start with '-'.
inline CliParseResult parse_cli(const std::vector<std::string>& args) {
  CliParseResult out;
  CliOptions& o = out.options;
  std::vector<std::string> scoped;  // options that belong to a single command
  bool only_positionals = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& tok = args[i];

    if (only_positionals || tok.size() < 2 || tok[0] != '-') {
      if (o.command.empty()) {
        o.command = tok;
      } else {
        o.positionals.push_back(tok);
      }
      continue;
    }
    if (tok == "--") {
      only_positionals = true;
      continue;
    }

    std::string opt = tok;
    std::optional<std::string> inline_value;
    const auto eq = tok.find('=');
    if (starts_with(tok, "--") && eq != std::string::npos) {
      opt = tok.substr(0, eq);
      inline_value = tok.substr(eq + 1);
    }
    if (opt == "-c") {
      opt = "--content";
    }

    auto take_value = [&](std::string& dst) -> bool {
      if (inline_value.has_value()) {
        dst = *inline_value;
        return true;
      }
      if (i + 1 >= args.size() || starts_with(args[i + 1], "--")) {
        out.error = "Error: option " + opt + " expects a value.";
        return false;
      }
      dst = args[++i];
      return true;
    };

    if (opt == "-h" || opt == "--help") {
      o.help = true;
    } else if (opt == "--version") {
      o.version = true;
    } else if (opt == "--debug") {
      o.debug = true;
    } else if (opt == "--json") {
      o.json_output = true;
      scoped.push_back(opt);
    } else if (opt == "--name" || opt == "--content" || opt == "--username" || opt == "--avatar" ||
               opt == "--interactions" || opt == "--flags") {
      std::string v;
      if (!take_value(v)) {
        return out;
      }
      scoped.push_back(opt);
      if (opt == "--name") {
        o.name = v;
      } else if (opt == "--content") {
        o.send.content = v;
      } else if (opt == "--username") {
        o.send.username = v;
      } else if (opt == "--avatar") {
        o.send.avatar = v;
      } else if (opt == "--interactions") {
        o.send.interactions = v;
      } else {
        const auto flags = parse_int(v);
        if (!flags.has_value()) {
          out.error = "Error: --flags expects an integer, got '" + v + "'.";
          return out;
        }
        o.send.flags = flags;
      }
    } else if (opt == "--reply" || opt == "--embed") {
      std::vector<std::string>& dst = opt == "--reply" ? o.send.replies : o.send.embeds;
      scoped.push_back(opt);
      if (inline_value.has_value()) {
        dst.push_back(*inline_value);
        continue;
      }
      while (i + 1 < args.size() && (args[i + 1].empty() || args[i + 1][0] != '-')) {
        dst.push_back(args[++i]);
      }
    } else {
      out.error = "Error: unrecognized option " + tok + ".";
      return out;
    }
  }

  if (o.help || o.version) {
    out.ok = true;
    return out;
  }
  if (o.command.empty()) {
    out.error = "Error: missing command (get, edit, delete or send).";
    return out;
  }
  if (!is_known_command(o.command)) {
    out.error = "Error: unknown command '" + o.command + "'.";
    return out;
  }
  for (const auto& s : scoped) {
    if (!option_allowed(o.command, s)) {
      out.error = "Error: option " + s + " is not valid for '" + o.command + "'.";
      return out;
    }
  }
  if (o.positionals.empty()) {
    out.error = "Error: provide either <url> or <id> <token>.";
    return out;
  }

  out.ok = true;
  return out;
}

}  // namespace stoatwh
