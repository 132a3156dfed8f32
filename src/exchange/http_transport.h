#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace exchange {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

enum class HttpMethod { Get, Post };

struct HttpRequest {
  HttpMethod method = HttpMethod::Get;
  std::string url;
  QueryParams query_params;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{std::chrono::seconds(10)};
};

struct HttpResponse {
  long status_code = 0;
  std::string body;
};

// Performs one HTTP exchange. Transport level failures (DNS, connect,
// timeout) throw std::runtime_error; HTTP error statuses are returned as-is.
using HttpTransport = std::function<HttpResponse(const HttpRequest&)>;

// Appends percent-encoded query parameters to |url|.
std::string buildUrl(const std::string& url, const QueryParams& query_params);
std::string encodeQueryParam(const std::string& value);

// libcurl backed transport. One instance owns the process-wide curl
// initialization; every call uses its own easy handle so concurrent requests
// never share state.
class CurlHttpTransport {
 public:
  CurlHttpTransport();
  ~CurlHttpTransport();

  CurlHttpTransport(const CurlHttpTransport&) = delete;
  CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

  HttpResponse perform(const HttpRequest& request) const;

  // Adapter usable wherever an HttpTransport is expected. The returned
  // function refers to this instance and must not outlive it.
  HttpTransport asTransport() const;

 private:
  static size_t curlWriteCallback(void* contents, size_t size, size_t nmemb, void* userp);
};

}  // namespace exchange
