#pragma once

#include <optional>
#include <string>

#include "stoatwh/common.hpp"
#include "stoatwh/http.hpp"

namespace stoatwh {

enum class ApiErrorType {
  kNotAuthenticated,
  kNotFound,
  kFailedValidation,
  // Anything else, including a missing discriminator.
  kOther,
};

inline ApiErrorType parse_api_error_type(const std::string& type) {
  if (type == "NotAuthenticated") {
    return ApiErrorType::kNotAuthenticated;
  }
  if (type == "NotFound") {
    return ApiErrorType::kNotFound;
  }
  if (type == "FailedValidation") {
    return ApiErrorType::kFailedValidation;
  }
  return ApiErrorType::kOther;
}

struct Failure {
  int exit_code{kExitOk};
  std::string message;
};

// Decodes an error body; only JSON objects count as the structured form.
inline std::optional<json> decode_error_body(const std::string& body) {
  try {
    json j = json::parse(body);
    if (j.is_object()) {
      return j;
    }
  } catch (const json::parse_error&) {
    Logger::log(Logger::Level::kDebug, "error body is not JSON");
  }
  return std::nullopt;
}

inline std::string validation_detail(const json& body) {
  const auto it = body.find("error");
  if (it == body.end() || it->is_null()) {
    return "unknown reason";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

inline std::string friendly_api_message(long status, const std::string& reason, const json& body) {
  std::string type;
  const auto it = body.find("type");
  if (it != body.end() && it->is_string()) {
    type = it->get<std::string>();
  }

  switch (parse_api_error_type(type)) {
    case ApiErrorType::kNotAuthenticated:
      return "Invalid webhook token";
    case ApiErrorType::kNotFound:
      return "Webhook not found - check if it exists and if the ID is correct";
    case ApiErrorType::kFailedValidation:
      return "Validation failed: " + validation_detail(body) + ".";
    case ApiErrorType::kOther:
    default:
      return "HTTP " + std::to_string(status) + ": " + (type.empty() ? reason : type);
  }
}

// Maps an unsuccessful response to the line printed on stderr and the exit
// code. In debug mode the whole decoded body replaces the friendly message.
inline Failure classify_failure(const HttpResponse& resp, bool debug) {
  Failure out;
  if (!resp.error.empty()) {
    out.exit_code = kExitNetwork;
    out.message = "Network error: " + resp.error;
    return out;
  }

  out.exit_code = static_cast<int>(resp.status);
  const auto body = decode_error_body(resp.body);
  if (!body.has_value()) {
    out.message = "HTTP " + std::to_string(resp.status) + ": " + resp.body;
    return out;
  }
  if (debug) {
    out.message = body->dump(2);
    return out;
  }
  out.message = "Error: " + friendly_api_message(resp.status, resp.reason, *body);
  return out;
}

}  // namespace stoatwh
