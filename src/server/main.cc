#define JWTGATE_LOG_COMPONENT "jwtgate.main"

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include <event2/event.h>

#include "jwtgate/auth/auth_types.h"
#include "jwtgate/config/service_config.h"
#include "jwtgate/logging/log_macros.h"
#include "jwtgate/logging/logger_registry.h"
#include "jwtgate/metrics/metrics_recorder.h"
#include "jwtgate/server/http_server.h"
#include "jwtgate/server/service_factory.h"

namespace {

void printUsage(const char* program) {
  std::cout << "jwtgate: JWT validation for proxy subrequest auth\n"
            << "Usage: " << program << " [options]\n"
            << "Options:\n"
            << "  --config <path>  YAML or JSON configuration file\n"
            << "                   (default: $JWTGATE_CONFIG)\n"
            << "  --help           Show this help message\n"
            << "Environment: PORT, WORKERS, LOG_LEVEL, LOG_FORMAT, JWKS_PATH,\n"
            << "  JWKS_URL, INSECURE_SKIP_VERIFY, JWKS_REFRESH_INTERVAL\n";
}

void onShutdownSignal(evutil_socket_t sig, short, void* arg) {
  JWTGATE_LOG(Info, "received signal {}, shutting down", static_cast<int>(sig));
  event_base_loopbreak(static_cast<event_base*>(arg));
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      printUsage(argv[0]);
      return 2;
    }
  }

  auto& registry = jwtgate::logging::LoggerRegistry::instance();

  std::shared_ptr<jwtgate::auth::KeyResolver> resolver;
  std::unique_ptr<jwtgate::server::HttpServer> server;
  try {
    jwtgate::config::ServiceConfig config =
        jwtgate::config::loadServiceConfig(config_path);
    registry.configure(jwtgate::logging::stringToLogLevel(config.log_level),
                       config.log_format);

    auto recorder = std::make_shared<jwtgate::metrics::PrometheusRecorder>();
    recorder->initialize();

    resolver = jwtgate::server::createKeyResolver(config);
    auto validator =
        jwtgate::server::createValidationService(config, resolver, recorder);

    jwtgate::server::HttpServerConfig server_config;
    server_config.port = config.port;
    server_config.workers = config.effectiveWorkers();
    server = std::make_unique<jwtgate::server::HttpServer>(
        server_config, validator, recorder);
    server->start();
  } catch (const jwtgate::auth::ConfigurationError& e) {
    JWTGATE_LOG(Critical, "configuration error: {}", e.what());
    registry.flushAll();
    return 1;
  } catch (const std::exception& e) {
    JWTGATE_LOG(Critical, "startup failed: {}", e.what());
    registry.flushAll();
    return 1;
  }

  std::unique_ptr<event_base, decltype(&event_base_free)> signal_base(
      event_base_new(), event_base_free);
  if (!signal_base) {
    JWTGATE_LOG(Critical, "cannot create signal event base");
    server->stop();
    resolver->stop();
    return 1;
  }
  event* sigint = evsignal_new(signal_base.get(), SIGINT, onShutdownSignal,
                               signal_base.get());
  event* sigterm = evsignal_new(signal_base.get(), SIGTERM, onShutdownSignal,
                                signal_base.get());
  if (!sigint || !sigterm || evsignal_add(sigint, nullptr) != 0 ||
      evsignal_add(sigterm, nullptr) != 0) {
    JWTGATE_LOG(Critical, "cannot install signal handlers");
    if (sigint) {
      event_free(sigint);
    }
    if (sigterm) {
      event_free(sigterm);
    }
    server->stop();
    resolver->stop();
    registry.flushAll();
    return 1;
  }
  std::signal(SIGPIPE, SIG_IGN);

  event_base_dispatch(signal_base.get());

  event_free(sigint);
  event_free(sigterm);

  server->stop();
  resolver->stop();
  JWTGATE_LOG(Info, "shutdown complete");
  registry.flushAll();
  return 0;
}
