#pragma once

#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "stoatwh/api_error.hpp"
#include "stoatwh/cli.hpp"
#include "stoatwh/config.hpp"
#include "stoatwh/http.hpp"
#include "stoatwh/locator.hpp"
#include "stoatwh/payload.hpp"

namespace stoatwh {

using Transport = std::function<HttpResponse(const HttpRequest&)>;
using StdinReader = std::function<std::optional<std::string>()>;

struct CommandContext {
  Config config{};
  bool debug{false};
  Transport transport;
  StdinReader read_stdin;
  std::ostream* out{&std::cout};
  std::ostream* err{&std::cerr};
};

inline std::map<std::string, std::string> json_headers() {
  return {{"Accept", "application/json"}, {"Content-Type", "application/json"}};
}

inline HttpRequest make_get_request(const std::string& url) {
  return HttpRequest{"GET", url, std::nullopt, {{"Accept", "application/json"}}};
}

inline HttpRequest make_edit_request(const std::string& url, const std::optional<std::string>& name) {
  json payload = json::object();
  if (name.has_value() && !name->empty()) {
    payload["name"] = *name;
  }
  return HttpRequest{"PATCH", url, payload.dump(), json_headers()};
}

inline HttpRequest make_delete_request(const std::string& url) {
  return HttpRequest{"DELETE", url, std::nullopt, {{"Accept", "application/json"}}};
}

// Every call draws a fresh idempotency key.
inline HttpRequest make_send_request(const std::string& url, const json& message) {
  HttpRequest req{"POST", url, message.dump(), json_headers()};
  req.headers["Idempotency-Key"] = uuid_v4();
  return req;
}

inline std::string display_field(const json& data, const std::string& key) {
  const auto it = data.find(key);
  if (it == data.end() || it->is_null()) {
    return "None";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

inline std::string format_webhook_info(const json& data) {
  std::ostringstream ss;
  ss << "Webhook ID : " << display_field(data, "id") << "\n";
  ss << "Name       : " << display_field(data, "name") << "\n";
  ss << "Creator    : " << display_field(data, "creator_id") << "\n";
  ss << "Channel    : " << display_field(data, "channel_id") << "\n";
  ss << "Permissions: " << display_field(data, "permissions") << "\n";
  if (data.contains("token")) {
    ss << "Token      : " << display_field(data, "token") << "\n";
  }
  return ss.str();
}

// Sends one request. Returns kExitOk on a 2xx response, otherwise the error
// line has already been written and the exit code is returned.
inline int perform_request(CommandContext& ctx, const HttpRequest& req, HttpResponse& resp) {
  Logger::log(Logger::Level::kDebug, req.method + " " + redact_token(req.url));
  resp = ctx.transport(req);
  if (!resp.error.empty()) {
    Logger::log(Logger::Level::kDebug, "transport failure: " + resp.error);
  } else {
    Logger::log(Logger::Level::kDebug, "HTTP " + std::to_string(resp.status));
  }

  if (!resp.ok()) {
    const Failure f = classify_failure(resp, ctx.debug);
    *ctx.err << f.message << "\n";
    return f.exit_code;
  }

  if (ctx.debug && !trim(resp.body).empty()) {
    try {
      *ctx.out << json::parse(resp.body).dump(2) << "\n";
    } catch (const json::parse_error& e) {
      Logger::log(Logger::Level::kWarn, std::string("response body is not JSON: ") + e.what());
      *ctx.out << resp.body << "\n";
    }
  }
  return kExitOk;
}

inline int run_get(CommandContext& ctx, const std::string& url, bool json_output) {
  HttpResponse resp;
  const int rc = perform_request(ctx, make_get_request(url), resp);
  if (rc != kExitOk) {
    return rc;
  }

  json data;
  try {
    data = json::parse(resp.body);
  } catch (const json::parse_error& e) {
    *ctx.err << "Error: unexpected response from API: " << json_error_detail(e) << "\n";
    return kExitBadResponse;
  }
  if (!data.is_object()) {
    *ctx.err << "Error: unexpected response from API: expected a JSON object\n";
    return kExitBadResponse;
  }

  if (json_output) {
    *ctx.out << data.dump(2) << "\n";
  } else {
    *ctx.out << format_webhook_info(data);
  }
  return kExitOk;
}

inline int run_edit(CommandContext& ctx, const std::string& url, const std::optional<std::string>& name) {
  HttpResponse resp;
  const int rc = perform_request(ctx, make_edit_request(url, name), resp);
  if (rc != kExitOk) {
    return rc;
  }
  *ctx.out << "Webhook updated.\n";
  return kExitOk;
}

inline int run_delete(CommandContext& ctx, const std::string& url) {
  HttpResponse resp;
  const int rc = perform_request(ctx, make_delete_request(url), resp);
  if (rc != kExitOk) {
    return rc;
  }
  *ctx.out << "Webhook deleted.\n";
  return kExitOk;
}

inline int run_send(CommandContext& ctx, const std::string& url, const SendOptions& opts) {
  const std::optional<std::string> piped = ctx.read_stdin ? ctx.read_stdin() : std::optional<std::string>();
  const PayloadResult payload = build_message(opts, piped);
  if (!payload.ok) {
    *ctx.err << payload.error << "\n";
    return payload.exit_code;
  }

  HttpResponse resp;
  const int rc = perform_request(ctx, make_send_request(url, payload.message), resp);
  if (rc != kExitOk) {
    return rc;
  }
  *ctx.out << "Message sent.\n";
  return kExitOk;
}

// Parses arguments (argv without the program name) and runs one command.
inline int run_cli(const std::vector<std::string>& args, CommandContext& ctx) {
  const CliParseResult parsed = parse_cli(args);
  if (!parsed.ok) {
    *ctx.err << parsed.error << "\n";
    return kExitUsage;
  }
  const CliOptions& o = parsed.options;
  if (o.help) {
    *ctx.out << usage_text();
    return kExitOk;
  }
  if (o.version) {
    *ctx.out << "stoat-wh " << kVersion << "\n";
    return kExitOk;
  }

  ctx.debug = ctx.debug || o.debug;
  if (ctx.debug) {
    Logger::set_min_level(Logger::Level::kDebug);
  }

  const LocatorResult loc = resolve_locator(o.positionals, ctx.config.api_base);
  if (!loc.ok) {
    *ctx.err << loc.error << "\n";
    return kExitUsage;
  }

  if (o.command == "get") {
    return run_get(ctx, loc.url, o.json_output);
  }
  if (o.command == "edit") {
    return run_edit(ctx, loc.url, o.name);
  }
  if (o.command == "delete") {
    return run_delete(ctx, loc.url);
  }
  return run_send(ctx, loc.url, o.send);
}

}  // namespace stoatwh
