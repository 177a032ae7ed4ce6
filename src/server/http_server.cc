#define JWTGATE_LOG_COMPONENT "jwtgate.server"

#include "jwtgate/server/http_server.h"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <netinet/in.h>
#include <pthread.h>
#include <sys/socket.h>
#include <unistd.h>

#include <event2/buffer.h>
#include <event2/event.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>
#include <event2/thread.h>
#include <event2/util.h>

#include "jwtgate/logging/log_macros.h"

namespace jwtgate {
namespace server {

namespace {

constexpr uint16_t kAllMethods =
    EVHTTP_REQ_GET | EVHTTP_REQ_POST | EVHTTP_REQ_HEAD | EVHTTP_REQ_PUT |
    EVHTTP_REQ_DELETE | EVHTTP_REQ_OPTIONS | EVHTTP_REQ_TRACE |
    EVHTTP_REQ_CONNECT | EVHTTP_REQ_PATCH;

void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

const char* methodName(evhttp_cmd_type cmd) {
  switch (cmd) {
    case EVHTTP_REQ_GET: return "GET";
    case EVHTTP_REQ_POST: return "POST";
    case EVHTTP_REQ_HEAD: return "HEAD";
    case EVHTTP_REQ_PUT: return "PUT";
    case EVHTTP_REQ_DELETE: return "DELETE";
    case EVHTTP_REQ_OPTIONS: return "OPTIONS";
    case EVHTTP_REQ_TRACE: return "TRACE";
    case EVHTTP_REQ_CONNECT: return "CONNECT";
    case EVHTTP_REQ_PATCH: return "PATCH";
    default: return "UNKNOWN";
  }
}

const char* reasonPhrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 401: return "Unauthorized";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 500: return "Internal Server Error";
    default: return "";
  }
}

void sendReply(evhttp_request* req, int status, const std::string& body,
               const char* content_type) {
  if (content_type) {
    evhttp_add_header(evhttp_request_get_output_headers(req), "Content-Type",
                      content_type);
  }
  evbuffer* buffer = evbuffer_new();
  if (buffer && !body.empty()) {
    evbuffer_add(buffer, body.data(), body.size());
  }
  evhttp_send_reply(req, status, reasonPhrase(status), buffer);
  if (buffer) {
    evbuffer_free(buffer);
  }
}

std::string uriDecode(const std::string& encoded) {
  size_t length = 0;
  char* decoded = evhttp_uridecode(encoded.c_str(), 1, &length);
  if (!decoded) {
    return encoded;
  }
  std::string result(decoded, length);
  free(decoded);
  return result;
}

uint16_t localPort(evutil_socket_t fd) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

}  // namespace

// One event loop thread with its own evhttp
class HttpServer::Worker {
 public:
  Worker(uint32_t index, HttpServer* server)
      : name_("worker_" + std::to_string(index)) {
    base_ = event_base_new();
    if (!base_) {
      throw std::runtime_error("failed to create event base");
    }
    http_ = evhttp_new(base_);
    if (!http_) {
      event_base_free(base_);
      throw std::runtime_error("failed to create evhttp");
    }
    evhttp_set_allowed_methods(http_, kAllMethods);
    evhttp_set_gencb(http_, &HttpServer::onRequest, server);
  }

  ~Worker() {
    stop();
    evhttp_free(http_);
    event_base_free(base_);
  }

  // Returns the listening socket, still owned by this worker's evhttp
  evutil_socket_t bind(const std::string& address, uint16_t port) {
    evhttp_bound_socket* handle =
        evhttp_bind_socket_with_handle(http_, address.c_str(), port);
    if (!handle) {
      throw std::runtime_error("cannot listen on " + address + ":" +
                               std::to_string(port));
    }
    return evhttp_bound_socket_get_fd(handle);
  }

  void accept(evutil_socket_t listen_fd) {
    evutil_socket_t fd = dup(listen_fd);
    if (fd < 0) {
      throw std::runtime_error("cannot duplicate listening socket");
    }
    if (evhttp_accept_socket(http_, fd) != 0) {
      evutil_closesocket(fd);
      throw std::runtime_error("cannot accept on duplicated socket");
    }
  }

  void start() {
    thread_ = std::thread([this]() { threadRoutine(); });
  }

  void stop() {
    if (thread_.joinable()) {
      // loopexit is queued even if the loop has not started yet
      event_base_loopexit(base_, nullptr);
      thread_.join();
    }
  }

 private:
  void threadRoutine() {
#ifdef __linux__
    pthread_setname_np(pthread_self(), name_.c_str());
#endif
    event_base_dispatch(base_);
  }

  std::string name_;
  event_base* base_{nullptr};
  evhttp* http_{nullptr};
  std::thread thread_;
};

HttpServer::HttpServer(const HttpServerConfig& config,
                       std::shared_ptr<auth::ValidationService> validator,
                       std::shared_ptr<metrics::MetricsRecorder> recorder)
    : config_(config),
      validator_(std::move(validator)),
      recorder_(std::move(recorder)) {
  if (!validator_) {
    throw std::invalid_argument("HttpServer requires a validation service");
  }
  if (!recorder_) {
    recorder_ = std::make_shared<metrics::NullRecorder>();
  }
  if (config_.workers == 0) {
    config_.workers = 1;
  }
}

HttpServer::~HttpServer() {
  stop();
}

void HttpServer::start() {
  if (running_.exchange(true)) {
    return;
  }
  ensureLibeventThreadingInitialized();

  try {
    for (uint32_t i = 0; i < config_.workers; ++i) {
      workers_.push_back(std::make_unique<Worker>(i, this));
    }
    evutil_socket_t listen_fd =
        workers_.front()->bind(config_.address, config_.port);
    for (size_t i = 1; i < workers_.size(); ++i) {
      workers_[i]->accept(listen_fd);
    }
    bound_port_ = localPort(listen_fd);
  } catch (const std::exception&) {
    workers_.clear();
    running_ = false;
    throw;
  }

  for (auto& worker : workers_) {
    worker->start();
  }
  JWTGATE_LOG(Info, "listening on {}:{} with {} workers", config_.address,
              bound_port_, workers_.size());
}

void HttpServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  for (auto& worker : workers_) {
    worker->stop();
  }
  workers_.clear();
  JWTGATE_LOG(Info, "server stopped");
}

void HttpServer::onRequest(evhttp_request* req, void* arg) {
  static_cast<HttpServer*>(arg)->dispatch(req);
}

void HttpServer::dispatch(evhttp_request* req) {
  try {
    auth::RequestContext ctx = buildContext(req);
    if (ctx.path == "/validate") {
      handleValidate(req, ctx);
    } else if (ctx.path == "/metrics") {
      handleMetrics(req);
    } else if (ctx.path == "/healthz") {
      handleHealth(req);
    } else {
      sendReply(req, 404, "404 page not found\n",
                "text/plain; charset=utf-8");
    }
  } catch (const std::exception& e) {
    JWTGATE_LOG(Error, "request dispatch failed: {}", e.what());
    sendReply(req, 500, "", nullptr);
  }
}

void HttpServer::handleValidate(evhttp_request* req,
                                const auth::RequestContext& ctx) {
  auth::ValidationResponse response = validator_->handle(ctx);
  evkeyvalq* out = evhttp_request_get_output_headers(req);
  for (const auto& header : response.headers) {
    evhttp_add_header(out, header.first.c_str(), header.second.c_str());
  }
  sendReply(req, response.status, "", nullptr);
}

void HttpServer::handleMetrics(evhttp_request* req) {
  sendReply(req, 200, recorder_->render(),
            "text/plain; version=0.0.4; charset=utf-8");
}

void HttpServer::handleHealth(evhttp_request* req) {
  sendReply(req, 200, "OK", "text/plain; charset=utf-8");
}

auth::QueryParameters HttpServer::parseQuery(const std::string& query) {
  auth::QueryParameters params;
  size_t start = 0;
  while (start <= query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    if (end > start) {
      std::string piece = query.substr(start, end - start);
      size_t eq = piece.find('=');
      if (eq == std::string::npos) {
        params.emplace_back(uriDecode(piece), std::string());
      } else {
        params.emplace_back(uriDecode(piece.substr(0, eq)),
                            uriDecode(piece.substr(eq + 1)));
      }
    }
    start = end + 1;
  }
  return params;
}

auth::RequestContext HttpServer::buildContext(evhttp_request* req) {
  auth::RequestContext ctx;
  ctx.method = methodName(evhttp_request_get_command(req));

  const char* uri = evhttp_request_get_uri(req);
  ctx.uri = uri ? uri : "";

  const evhttp_uri* parsed = evhttp_request_get_evhttp_uri(req);
  const char* path = parsed ? evhttp_uri_get_path(parsed) : nullptr;
  ctx.path = (path && *path) ? path : "/";

  const char* query = parsed ? evhttp_uri_get_query(parsed) : nullptr;
  if (query) {
    ctx.query = parseQuery(query);
  }

  evkeyvalq* headers = evhttp_request_get_input_headers(req);
  for (evkeyval* kv = headers->tqh_first; kv; kv = kv->next.tqe_next) {
    ctx.headers.emplace_back(kv->key, kv->value);
  }
  return ctx;
}

}  // namespace server
}  // namespace jwtgate
