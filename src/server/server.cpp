#include <authbridge/server/server.hpp>
#include <authbridge/jwks_validator.hpp>
#include <authbridge/otel_tracer.hpp>
#include <authbridge/shutdown.hpp>
#include <authbridge/span_manager.hpp>
#include <authbridge/token_exchanger.hpp>
#include <authbridge/version.hpp>

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace authbridge::server {

namespace {

constexpr auto kGrpcDrainTimeout = std::chrono::seconds(5);

}  // namespace

void ApplyLogLevel(const std::string& level) {
  if (level == "debug") {
    trantor::Logger::setLogLevel(trantor::Logger::kDebug);
  } else if (level == "warn") {
    trantor::Logger::setLogLevel(trantor::Logger::kWarn);
  } else if (level == "error") {
    trantor::Logger::setLogLevel(trantor::Logger::kError);
  } else {
    trantor::Logger::setLogLevel(trantor::Logger::kInfo);
  }
}

Server::Server(const Config& config) : config_(config) {
  // Validate configuration
  config_.Validate();
  ApplyLogLevel(config_.server.log_level);

  BuildComponents();
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
  if (tracer_) {
    tracer_->Shutdown();
  }
}

void Server::BuildComponents() {
  if (config_.metrics.enabled) {
    metrics_ = std::make_shared<PrometheusMetrics>();
  }

  config_store_ = std::make_shared<ConfigStore>(config_.credentials, config_.outbound);
  config_store_->WaitForCredentials(std::chrono::seconds(config_.credentials.wait_seconds));

  http_ = std::make_shared<DrogonHttpTransport>();

  ProcessorComponents components;
  components.metrics = metrics_;
  components.config_store = config_store_;

  // --- Inbound validation ---
  if (config_.InboundValidationEnabled()) {
    JwksCacheOptions cache_options;
    cache_options.refresh_seconds = config_.inbound.jwks_refresh_seconds;
    cache_options.min_refresh_seconds = config_.inbound.jwks_min_refresh_seconds;
    cache_options.timeout_ms = config_.inbound.timeout_ms;
    auto cache = std::make_shared<JwksCache>(http_, cache_options, metrics_);

    JwksValidatorOptions validator_options;
    validator_options.jwks_url = config_.JwksUrl();
    validator_options.leeway_seconds = config_.inbound.leeway_seconds;
    components.validator = std::make_shared<JwksValidator>(cache, validator_options);
    LOG_INFO << "[Inbound] JWT validation enabled (issuer=" << config_.inbound.issuer
             << ", jwks=" << validator_options.jwks_url << ")";
  } else {
    LOG_INFO << "[Inbound] JWT validation disabled (no issuer configured)";
  }

  // --- Outbound exchange ---
  auto store = config_store_;
  components.exchanger = std::make_shared<TokenExchanger>(
      http_, [store]() { return store->Snapshot().Client(); }, config_.outbound.timeout_ms,
      metrics_);
  if (config_.outbound.on_exchange_failure == ExchangeFailurePolicy::kForward) {
    LOG_WARN << "[Outbound] Failed token exchanges forward the original token "
                "(set TOKEN_EXCHANGE_FAILURE_POLICY=deny to reject them)";
  }

  // --- Tracing ---
  if (config_.tracing.enabled) {
    OtelOptions otel;
    otel.endpoint = config_.tracing.endpoint;
    otel.service_name = config_.tracing.service_name;
    otel.agent_name = config_.tracing.agent_name;
    otel.agent_version = config_.tracing.agent_version;
    otel.agent_provider = config_.tracing.agent_provider;

    std::string error;
    tracer_ = CreateOtelTracer(otel, &error);
    if (tracer_) {
      LOG_INFO << "[Tracing] Exporting spans to " << OtlpTracesUrl(otel.endpoint);
    } else {
      LOG_ERROR << "[Tracing] Failed to create tracer, continuing without traces: " << error;
    }
  }

  SpanManagerOptions span_options;
  span_options.agent_name = config_.tracing.agent_name;
  span_options.agent_version = config_.tracing.agent_version;
  span_options.agent_provider = config_.tracing.agent_provider;
  span_options.max_attribute_length = config_.tracing.max_attribute_length;
  components.spans =
      std::make_shared<SpanManager>(tracer_, span_options, nullptr, metrics_);

  ProcessorOptions options;
  options.expected_issuer = config_.inbound.issuer;
  options.expected_audience = config_.inbound.expected_audience;
  options.on_exchange_failure = config_.outbound.on_exchange_failure;

  processor_ = std::make_unique<StreamProcessor>(options, std::move(components));
  service_ = std::make_unique<ExtProcService>(processor_.get());
}

void Server::SetupAdminRoutes() {
  drogon::app().registerHandler(
      "/healthz",
      [](const drogon::HttpRequestPtr& req,
         std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        (void)req;
        Json::Value body;
        body["status"] = "ok";
        body["version"] = Version();
        callback(drogon::HttpResponse::newHttpJsonResponse(body));
      },
      {drogon::Get});

  if (metrics_) {
    RegisterMetricsHandler(metrics_, config_.metrics.path);
  }
}

void Server::SetupShutdown() {
  GlobalShutdownHandler().OnShutdown([]() {
    std::cout << "Shutting down admin server..." << std::endl;
    drogon::app().quit();
  });
  if (!GlobalShutdownHandler().InstallSignalHandlers()) {
    LOG_WARN << "Failed to install signal handlers";
  }
}

void Server::StartGrpc() {
  std::string address = config_.server.host + ":" + std::to_string(config_.server.port);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(address, grpc::InsecureServerCredentials());
  builder.RegisterService(service_.get());

  // Upper bound on idle polling threads of the sync server.
  uint32_t threads = config_.server.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 4;  // Fallback
  }
  builder.SetSyncServerOption(grpc::ServerBuilder::SyncServerOption::MAX_POLLERS,
                              static_cast<int>(threads));
  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_) {
    throw std::runtime_error("Failed to start ext_proc server on " + address);
  }
}

void Server::Run() {
  running_ = true;

  StartGrpc();

  // Configure Drogon for the admin endpoints
  auto& app = drogon::app();
  app.addListener(config_.server.host, config_.server.admin_port);

  app.setThreadNum(1);  // admin traffic only
  app.disableSession();
  app.disableSigtermHandling();

  SetupAdminRoutes();
  SetupShutdown();

  std::cout << "AuthBridge " << Version() << " ext_proc listening on " << config_.server.host
            << ":" << config_.server.port << ", admin on port " << config_.server.admin_port
            << std::endl;

  // Run Drogon (blocking)
  app.run();

  std::cout << "Draining ext_proc streams..." << std::endl;
  grpc_server_->Shutdown(std::chrono::system_clock::now() + kGrpcDrainTimeout);
  grpc_server_.reset();
  if (tracer_) {
    tracer_->Flush();
  }

  running_ = false;
  std::cout << "Server stopped." << std::endl;
}

void Server::Shutdown() {
  if (running_) {
    GlobalShutdownHandler().Shutdown();
  }
}

}  // namespace authbridge::server
