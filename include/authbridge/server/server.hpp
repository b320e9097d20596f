#pragma once

#include <authbridge/http_transport.hpp>
#include <authbridge/observability.hpp>
#include <authbridge/server/config.hpp>
#include <authbridge/server/config_store.hpp>
#include <authbridge/server/ext_proc_service.hpp>
#include <authbridge/server/metrics.hpp>
#include <authbridge/server/stream_processor.hpp>

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

namespace authbridge::server {

/**
 * AuthBridge processor.
 *
 * Serves the ext_proc gRPC service on server.port and a Drogon admin
 * listener (/healthz, /metrics) on server.admin_port. Components are built
 * in the constructor; Run() starts both listeners and blocks until
 * shutdown.
 */
class Server {
 public:
  /**
   * Create a server with the given configuration.
   * Blocks up to credentials.wait_seconds for the credential files.
   * @throws std::runtime_error if the configuration is invalid.
   */
  explicit Server(const Config& config);

  ~Server();

  // Non-copyable, non-movable
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Start the server (blocking).
   * Returns when the server shuts down.
   */
  void Run();

  /**
   * Request shutdown (async).
   */
  void Shutdown();

  StreamProcessor* processor() { return processor_.get(); }
  PrometheusMetrics* metrics() { return metrics_.get(); }

 private:
  void BuildComponents();
  void SetupAdminRoutes();
  void SetupShutdown();
  void StartGrpc();

  Config config_;
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::shared_ptr<HttpTransport> http_;
  std::shared_ptr<ConfigStore> config_store_;
  std::shared_ptr<Tracer> tracer_;
  std::unique_ptr<StreamProcessor> processor_;
  std::unique_ptr<ExtProcService> service_;
  std::unique_ptr<grpc::Server> grpc_server_;
  bool running_ = false;
};

/** Map a config log level ("debug", "info", ...) onto trantor's logger. */
void ApplyLogLevel(const std::string& level);

}  // namespace authbridge::server
