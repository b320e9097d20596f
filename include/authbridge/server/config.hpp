#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace authbridge::server {

/**
 * Listener configuration.
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 9090;        // ext_proc gRPC
  uint16_t admin_port = 9091;  // /healthz and /metrics
  uint32_t threads = 0;        // 0 = auto-detect CPU cores
  std::string log_level = "info";
};

/**
 * Where the OAuth2 client credentials come from. Files win over literals.
 */
struct CredentialsConfig {
  std::string client_id_file = "/shared/client-id.txt";
  std::string client_secret_file = "/shared/client-secret.txt";
  std::string client_id;
  std::string client_secret;
  uint32_t wait_seconds = 60;
};

enum class ExchangeFailurePolicy {
  kForward,  // pass the original request through unchanged
  kDeny      // answer 503 without forwarding
};

/**
 * Outbound token exchange configuration.
 */
struct OutboundConfig {
  std::string token_url;
  std::string target_audience;
  std::string target_scopes;
  ExchangeFailurePolicy on_exchange_failure = ExchangeFailurePolicy::kForward;
  uint32_t timeout_ms = 10000;
};

/**
 * Inbound JWT validation configuration.
 */
struct InboundConfig {
  std::string issuer;
  std::string expected_audience;
  std::string jwks_url;  // empty = derived from outbound.token_url
  uint32_t jwks_refresh_seconds = 3600;
  uint32_t jwks_min_refresh_seconds = 30;
  int64_t leeway_seconds = 0;
  uint32_t timeout_ms = 10000;
};

/**
 * Trace export configuration.
 */
struct TracingConfig {
  bool enabled = true;
  std::string endpoint = "http://otel-collector.kagenti-system.svc.cluster.local:8335";
  std::string service_name = "weather-service";
  std::string agent_name = "weather-assistant";
  std::string agent_version = "1.0.0";
  std::string agent_provider = "langchain";
  uint32_t max_attribute_length = 1000;
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

/**
 * Complete processor configuration.
 */
struct Config {
  ServerConfig server;
  CredentialsConfig credentials;
  OutboundConfig outbound;
  InboundConfig inbound;
  TracingConfig tracing;
  MetricsConfig metrics;

  // Returns the value of an environment variable or nullptr.
  using EnvLookup = std::function<const char*(const char*)>;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   *
   * Precedence (lowest first): defaults, --config file, environment,
   * command-line flags.
   *
   * @param argc Argument count
   * @param argv Argument values
   * @param env Environment lookup (defaults to the process environment)
   * @return Parsed configuration
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv, const EnvLookup& env = nullptr);

  /**
   * Overlay values from environment variables (TOKEN_URL, ISSUER, ...).
   * @throws std::runtime_error on malformed values.
   */
  void ApplyEnvironment(const EnvLookup& env);

  /**
   * JWKS endpoint: inbound.jwks_url, else the token URL with its "/token"
   * suffix replaced by "/certs". Empty if neither is configured.
   */
  std::string JwksUrl() const;

  /** True when inbound requests must carry a valid JWT. */
  bool InboundValidationEnabled() const;

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

ExchangeFailurePolicy ParseExchangeFailurePolicy(const std::string& value);
const char* ExchangeFailurePolicyName(ExchangeFailurePolicy policy);

}  // namespace authbridge::server
