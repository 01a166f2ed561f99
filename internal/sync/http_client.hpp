#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace practicedb::sync {

struct HttpRequest {
  std::string                        method = "GET";
  std::string                        url;
  std::map<std::string, std::string> headers;
  std::string                        body;
  std::chrono::milliseconds          timeout{30000};

  void SetJsonBody(std::string json) {
    body                    = std::move(json);
    headers["Content-Type"] = "application/json";
  }
};

struct HttpResponse {
  int                                status = 0;
  std::map<std::string, std::string> headers;
  std::string                        body;

  bool Ok() const {
    return status >= 200 && status < 300;
  }
};

/*
  Blocking HTTP transport used by SyncManager.

  Send throws std::runtime_error when no response could be obtained
  (resolve, connect, timeout). Any HTTP status is a response.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Send(const HttpRequest& request) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

} // namespace practicedb::sync
