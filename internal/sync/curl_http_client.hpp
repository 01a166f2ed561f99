#pragma once

#include "http_client.hpp"

namespace practicedb::sync {

/*
  HttpClient backed by libcurl's easy interface.

  One easy handle per request. Redirects are followed, chunked and
  compressed bodies are decoded by curl. Header names in the response
  are lower-cased.
*/
class CurlHttpClient final : public HttpClient {
 public:
  CurlHttpClient();

  HttpResponse Send(const HttpRequest& request) override;
};

} // namespace practicedb::sync
