#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "jwtgate/auth/request_context.h"
#include "jwtgate/auth/validation_service.h"
#include "jwtgate/metrics/metrics_recorder.h"

struct event_base;
struct evhttp;
struct evhttp_request;

namespace jwtgate {
namespace server {

struct HttpServerConfig {
  std::string address{"0.0.0.0"};
  uint16_t port{8080};  // 0 picks an ephemeral port
  uint32_t workers{1};
};

/**
 * @brief evhttp front end for the validation service
 *
 * Routes:
 *   /validate  ValidationService::handle
 *   /metrics   Prometheus text exposition from the recorder
 *   /healthz   200 "OK"
 * Anything else is 404.
 *
 * Every worker thread owns an event base and an evhttp instance accepting
 * on its own duplicate of the single listening socket.
 */
class HttpServer {
 public:
  HttpServer(const HttpServerConfig& config,
             std::shared_ptr<auth::ValidationService> validator,
             std::shared_ptr<metrics::MetricsRecorder> recorder);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /**
   * @brief Bind the port and start the worker threads
   * @throws std::runtime_error if the socket cannot be bound
   */
  void start();

  // Breaks every worker loop and joins the threads. Idempotent.
  void stop();

  bool isRunning() const { return running_.load(); }

  // Actual port after start(); useful when configured with port 0
  uint16_t boundPort() const { return bound_port_; }

  /**
   * @brief Split a raw query string into decoded name/value pairs
   *
   * Empty pieces ("a=1&&b=2") are skipped and a piece without '=' yields an
   * empty value, so one odd argument never discards the rest.
   */
  static auth::QueryParameters parseQuery(const std::string& query);

 private:
  class Worker;

  static void onRequest(evhttp_request* req, void* arg);
  void dispatch(evhttp_request* req);
  void handleValidate(evhttp_request* req, const auth::RequestContext& ctx);
  void handleMetrics(evhttp_request* req);
  void handleHealth(evhttp_request* req);

  static auth::RequestContext buildContext(evhttp_request* req);

  HttpServerConfig config_;
  std::shared_ptr<auth::ValidationService> validator_;
  std::shared_ptr<metrics::MetricsRecorder> recorder_;

  std::vector<std::unique_ptr<Worker>> workers_;
  std::atomic<bool> running_{false};
  uint16_t bound_port_{0};
};

}  // namespace server
}  // namespace jwtgate
