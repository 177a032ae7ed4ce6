#ifndef JWTGATE_AUTH_HTTP_CLIENT_H
#define JWTGATE_AUTH_HTTP_CLIENT_H

#include <chrono>
#include <map>
#include <memory>
#include <string>

/**
 * @file http_client.h
 * @brief Blocking libcurl client used to fetch key sets
 */

namespace jwtgate {
namespace auth {

enum class HttpMethod { GET, HEAD, POST };

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
  int status_code{-1};                        // -1 when no response arrived
  std::map<std::string, std::string> headers;  // names lower-cased
  std::string body;
  std::string error;                          // transport error, if any
  std::chrono::milliseconds latency{0};
};

/**
 * @brief HTTP request configuration
 */
struct HttpRequest {
  std::string url;
  HttpMethod method;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout;
  bool verify_ssl;
  bool follow_redirects;
  int max_redirects;

  HttpRequest()
      : method(HttpMethod::GET),
        timeout(10),
        verify_ssl(true),
        follow_redirects(true),
        max_redirects(5) {}
};

/**
 * @brief Synchronous HTTP client; one easy handle per request
 *
 * Safe to share between threads.
 */
class HttpClient {
 public:
  struct Config {
    std::chrono::seconds connection_timeout;
    std::string user_agent;

    Config() : connection_timeout(5), user_agent("jwtgate/1.0") {}
  };

  explicit HttpClient(const Config& config = Config());
  ~HttpClient();

  HttpResponse request(const HttpRequest& request);

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace auth
}  // namespace jwtgate

#endif  // JWTGATE_AUTH_HTTP_CLIENT_H
