#pragma once
#include <string>
#include <vector>

namespace unchessful::net {

enum class HttpMethod { Get, Post };

struct HttpRequest {
  HttpMethod method = HttpMethod::Get;
  std::string url;
  std::string body;
  std::vector<std::string> headers;  // "Name: value"
  long connectTimeoutMs = 0;         // 0 = transport default
  long totalTimeoutMs = 0;           // 0 = no limit
  std::string userAgent;
};

enum class TransferResult {
  Completed,  // a response arrived; look at `status`
  Failed,     // no response: DNS, refused, reset, timeout, TLS
  Aborted     // stopped through the cancel flag
};

struct HttpResponse {
  TransferResult result = TransferResult::Failed;
  long status = 0;
  std::string body;
  std::string error;  // transport message when result != Completed

  [[nodiscard]] bool ok() const noexcept {
    return result == TransferResult::Completed && status >= 200 && status < 300;
  }
};

const char* toString(TransferResult r);

}  // namespace unchessful::net
