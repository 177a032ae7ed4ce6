#include "jwtgate/auth/http_client.h"

#include <algorithm>
#include <cctype>
#include <mutex>

#include <curl/curl.h>

namespace jwtgate {
namespace auth {

namespace {

std::once_flag g_curl_init;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  std::string* response = static_cast<std::string*>(userdata);
  response->append(ptr, size * nmemb);
  return size * nmemb;
}

size_t header_callback(char* buffer,
                       size_t size,
                       size_t nitems,
                       void* userdata) {
  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
  std::string header(buffer, size * nitems);

  size_t colon_pos = header.find(':');
  if (colon_pos != std::string::npos) {
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);

    name.erase(0, name.find_first_not_of(" \t"));
    name.erase(name.find_last_not_of(" \t\r\n") + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);

    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (!name.empty()) {
      (*headers)[name] = value;
    }
  }

  return size * nitems;
}

}  // namespace

class HttpClient::Impl {
 public:
  explicit Impl(const Config& config) : config_(config) {
    std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_ALL); });
  }

  HttpResponse request(const HttpRequest& request) {
    auto start = std::chrono::steady_clock::now();
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
      response.error = "Failed to initialize CURL";
      return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    switch (request.method) {
      case HttpMethod::POST:
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(request.body.size()));
        break;
      case HttpMethod::HEAD:
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        break;
      default:  // GET
        break;
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header_pair : request.headers) {
      std::string header = header_pair.first + ": " + header_pair.second;
      headers = curl_slist_append(headers, header.c_str());
    }
    if (headers) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER,
                     request.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST,
                     request.verify_ssl ? 2L : 0L);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION,
                     request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS,
                     static_cast<long>(request.max_redirects));

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(config_.connection_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                     static_cast<long>(request.timeout.count()));

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = http_code > 0 ? static_cast<int>(http_code) : -1;

    if (res != CURLE_OK) {
      response.error = curl_easy_strerror(res);
    }

    response.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (headers) {
      curl_slist_free_all(headers);
    }
    curl_easy_cleanup(curl);

    return response;
  }

 private:
  Config config_;
};

HttpClient::HttpClient(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::request(const HttpRequest& request) {
  return impl_->request(request);
}

}  // namespace auth
}  // namespace jwtgate
