#include "exchange/http_transport.h"

#include <curl/curl.h>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace exchange {

std::string encodeQueryParam(const std::string& value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped << c;
    } else {
      escaped << '%' << std::uppercase << std::setw(2) << static_cast<int>(c) << std::nouppercase;
    }
  }

  return escaped.str();
}

std::string buildUrl(const std::string& url, const QueryParams& query_params) {
  if (query_params.empty()) {
    return url;
  }

  std::string built = url;
  built.push_back(url.find('?') == std::string::npos ? '?' : '&');
  bool first = true;
  for (const auto& [key, value] : query_params) {
    if (!first) {
      built.push_back('&');
    }
    first = false;
    built += encodeQueryParam(key);
    built.push_back('=');
    built += encodeQueryParam(value);
  }
  return built;
}

CurlHttpTransport::CurlHttpTransport() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != 0) {
    throw std::runtime_error("Failed to initialize cURL");
  }
}

CurlHttpTransport::~CurlHttpTransport() {
  curl_global_cleanup();
}

HttpTransport CurlHttpTransport::asTransport() const {
  return [this](const HttpRequest& request) { return perform(request); };
}

HttpResponse CurlHttpTransport::perform(const HttpRequest& request) const {
  const std::string url = buildUrl(request.url, request.query_params);

  CURL* curl = curl_easy_init();
  if (!curl) {
    throw std::runtime_error("Failed to initialize CURL easy handle");
  }

  HttpResponse response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlHttpTransport::curlWriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));

  if (request.method == HttpMethod::Post) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  }

  struct curl_slist* header_list = nullptr;
  for (const auto& [key, value] : request.headers) {
    header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
  }
  header_list = curl_slist_append(header_list, "Accept: application/json");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

  const CURLcode result = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);

  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);

  if (result != CURLE_OK) {
    throw std::runtime_error(std::string("cURL request failed: ") + curl_easy_strerror(result));
  }

  return response;
}

size_t CurlHttpTransport::curlWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  const size_t total_size = size * nmemb;
  auto* buffer = static_cast<std::string*>(userp);
  buffer->append(static_cast<char*>(contents), total_size);
  return total_size;
}

}  // namespace exchange
