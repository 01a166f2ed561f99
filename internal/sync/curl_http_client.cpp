#include "curl_http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace practicedb::sync {

namespace {

struct EasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

size_t WriteBody(char* data, size_t size, size_t count, void* user) {
  static_cast<std::string*>(user)->append(data, size * count);
  return size * count;
}

// Called once per header line, for every response in a redirect chain.
size_t WriteHeader(char* data, size_t size, size_t count, void* user) {
  auto*             headers = static_cast<std::map<std::string, std::string>*>(user);
  const std::string line(data, size * count);

  if (line.rfind("HTTP/", 0) == 0) {
    headers->clear();
  } else if (const auto colon = line.find(':'); colon != std::string::npos) {
    (*headers)[Lower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
  }
  return size * count;
}

void Check(CURLcode rc, const char* what) {
  if (rc != CURLE_OK) {
    throw std::runtime_error(std::string("http: ") + what + ": " + curl_easy_strerror(rc));
  }
}

} // namespace

CurlHttpClient::CurlHttpClient() {
  static std::once_flag init;
  std::call_once(init, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("http: curl_global_init failed");
    }
  });
}

HttpResponse CurlHttpClient::Send(const HttpRequest& request) {
  EasyHandle handle(curl_easy_init());
  if (!handle) {
    throw std::runtime_error("http: curl_easy_init failed");
  }
  CURL* curl = handle.get();

  HeaderList headers;
  const auto append = [&headers](const std::string& line) {
    curl_slist* head = curl_slist_append(headers.get(), line.c_str());
    if (!head) throw std::runtime_error("http: curl_slist_append failed");
    if (!headers) headers.reset(head);
  };
  for (const auto& [name, value] : request.headers) append(name + ": " + value);
  // No "Expect: 100-continue" round trip on larger bodies.
  append("Expect:");

  HttpResponse response;
  char         error[CURL_ERROR_SIZE] = {0};

  Check(curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str()), "set url");
  Check(curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error), "set error buffer");
  Check(curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L), "set nosignal");
  Check(curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L), "set follow location");
  Check(curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L), "set max redirects");
  Check(curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, ""), "set accept encoding");
  Check(curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count())), "set timeout");
  Check(curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get()), "set headers");
  Check(curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &WriteBody), "set write function");
  Check(curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body), "set write data");
  Check(curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &WriteHeader), "set header function");
  Check(curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers), "set header data");

  if (request.method == "GET") {
    Check(curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L), "set get");
  } else {
    Check(curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str()), "set method");
    Check(curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size())), "set body size");
    Check(curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str()), "set body");
  }

  if (const CURLcode rc = curl_easy_perform(curl); rc != CURLE_OK) {
    const std::string detail = error[0] ? error : curl_easy_strerror(rc);
    throw std::runtime_error("http: " + request.method + " " + request.url + " failed: " + detail);
  }

  long status = 0;
  Check(curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status), "read status");
  response.status = static_cast<int>(status);
  return response;
}

} // namespace practicedb::sync
