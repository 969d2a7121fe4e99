#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <curl/curl.h>

#include "stoatwh/common.hpp"

namespace stoatwh {

struct HttpResponse {
  long status{0};
  std::string body;
  std::string reason;
  std::string error;

  // Anything below 400 that survived redirect handling counts as success.
  bool ok() const { return error.empty() && status >= 200 && status < 400; }
};

struct CurlTimeouts {
  long total_s{0};
  long connect_s{0};
};

// The whole budget applies to the connect phase as well as to the transfer.
inline CurlTimeouts curl_timeouts(int timeout_s) {
  const long t = static_cast<long>((std::max)(1, timeout_s));
  return CurlTimeouts{t, t};
}

struct HttpRequest {
  std::string method{"GET"};
  std::string url;
  std::optional<std::string> body;
  std::map<std::string, std::string> headers{};
};

inline std::string standard_reason_phrase(long status) {
  switch (status) {
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 409:
      return "Conflict";
    case 413:
      return "Payload Too Large";
    case 422:
      return "Unprocessable Entity";
    case 429:
      return "Too Many Requests";
    case 500:
      return "Internal Server Error";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    case 504:
      return "Gateway Timeout";
    default:
      return "";
  }
}

inline std::string status_line_reason(const std::string& line) {
  const auto sp1 = line.find(' ');
  const auto sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
  return sp2 == std::string::npos ? "" : trim(line.substr(sp2 + 1));
}

class HttpClient {
 public:
  explicit HttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {
    ensure_global_init();
    easy_ = curl_easy_init();
  }

  ~HttpClient() {
    if (easy_) {
      curl_easy_cleanup(easy_);
      easy_ = nullptr;
    }
  }

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  HttpResponse request(const HttpRequest& req, int timeout_s, bool follow_redirects = true,
                       long max_redirects = 5) {
    CURL* curl = ensure_easy();
    if (!curl) {
      HttpResponse failed;
      failed.error = "curl init failed";
      return failed;
    }

    curl_easy_reset(curl);
    std::string response_body;
    std::string reason;
    struct curl_slist* header_list = nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &reason);
    apply_common_options(curl, timeout_s, follow_redirects, max_redirects);

    if (req.method == "GET") {
      curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (req.method == "POST") {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else {
      curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }
    if (req.body.has_value()) {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body->c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body->size()));
    }

    for (const auto& [k, v] : req.headers) {
      const std::string line = k + ": " + v;
      header_list = curl_slist_append(header_list, line.c_str());
    }
    if (header_list) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    const CURLcode rc = curl_easy_perform(curl);

    HttpResponse out;
    if (rc != CURLE_OK) {
      out.error = curl_easy_strerror(rc);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    out.body = std::move(response_body);
    out.reason = reason.empty() ? standard_reason_phrase(out.status) : reason;

    if (header_list) {
      curl_slist_free_all(header_list);
    }
    return out;
  }

 private:
  static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, n);
    return n;
  }

  // Keeps the reason phrase of the last status line ("HTTP/1.1 404 Not Found");
  // a redirect chain yields several.
  static size_t header_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto n = size * nmemb;
    auto* reason = static_cast<std::string*>(userdata);
    if (!reason || !ptr || n == 0) {
      return n;
    }
    const std::string line(ptr, n);
    if (starts_with(line, "HTTP/")) {
      *reason = status_line_reason(line);
    }
    return n;
  }

  static void ensure_global_init() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  CURL* ensure_easy() {
    if (!easy_) {
      easy_ = curl_easy_init();
    }
    return easy_;
  }

  void apply_common_options(CURL* curl, int timeout_s, bool follow_redirects, long max_redirects) {
    const CurlTimeouts timeouts = curl_timeouts(timeout_s);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeouts.total_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeouts.connect_s);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, max_redirects);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");  // allow gzip/br
  }

  std::string user_agent_;
  CURL* easy_{nullptr};
};

}  // namespace stoatwh
