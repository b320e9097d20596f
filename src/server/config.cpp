#include <authbridge/server/config.hpp>
#include <authbridge/internal.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace authbridge::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --host <addr>             Bind address (default: 0.0.0.0)\n"
            << "  --port, -p <port>         ext_proc gRPC port (default: 9090)\n"
            << "  --admin-port <port>       Health/metrics HTTP port (default: 9091)\n"
            << "  --threads <n>             gRPC polling threads (default: auto)\n"
            << "  --token-url <url>         OAuth2 token endpoint\n"
            << "  --issuer <iss>            Expected issuer of inbound JWTs\n"
            << "  --disable-tracing         Do not create or export spans\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --help, -h                Show this help\n"
            << "\nEnvironment:\n"
            << "  TOKEN_URL, TARGET_AUDIENCE, TARGET_SCOPES, CLIENT_ID_FILE,\n"
            << "  CLIENT_SECRET_FILE, CLIENT_ID, CLIENT_SECRET, ISSUER,\n"
            << "  EXPECTED_AUDIENCE, JWKS_URL, OTEL_TRACING_ENABLED,\n"
            << "  OTEL_EXPORTER_OTLP_ENDPOINT, OTEL_SERVICE_NAME, AGENT_NAME,\n"
            << "  AGENT_VERSION, AGENT_PROVIDER, TOKEN_EXCHANGE_FAILURE_POLICY\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --port 9090\n"
            << "  " << argv0 << " --config /etc/authbridge/authbridge.yaml\n";
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

uint16_t ParsePort(const std::string& value) {
  unsigned long port = std::stoul(value);
  if (port == 0 || port > 65535) {
    throw std::runtime_error("Invalid port number: " + value);
  }
  return static_cast<uint16_t>(port);
}

// Env values that are set but empty count as unset.
bool Lookup(const Config::EnvLookup& env, const char* name, std::string* out) {
  const char* value = env(name);
  if (!value || *value == '\0') return false;
  *out = value;
  return true;
}

}  // namespace

ExchangeFailurePolicy ParseExchangeFailurePolicy(const std::string& value) {
  std::string lower = internal::ToLower(value);
  if (lower == "forward") return ExchangeFailurePolicy::kForward;
  if (lower == "deny") return ExchangeFailurePolicy::kDeny;
  throw std::runtime_error("Invalid on_exchange_failure: " + value +
                           " (must be forward or deny)");
}

const char* ExchangeFailurePolicyName(ExchangeFailurePolicy policy) {
  return policy == ExchangeFailurePolicy::kDeny ? "deny" : "forward";
}

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  // Format:
  //   section:
  //     key: value
  while (std::getline(file, line)) {
    line = internal::Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }
    std::string key = internal::Trim(line.substr(0, colon_pos));
    std::string value = internal::Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    try {
      if (current_section == "server") {
        if (key == "host") {
          config.server.host = value;
        } else if (key == "port") {
          config.server.port = ParsePort(value);
        } else if (key == "admin_port") {
          config.server.admin_port = ParsePort(value);
        } else if (key == "threads") {
          config.server.threads = static_cast<uint32_t>(std::stoul(value));
        } else if (key == "log_level") {
          config.server.log_level = value;
        }
      } else if (current_section == "credentials") {
        if (key == "client_id_file") {
          config.credentials.client_id_file = value;
        } else if (key == "client_secret_file") {
          config.credentials.client_secret_file = value;
        } else if (key == "client_id") {
          config.credentials.client_id = value;
        } else if (key == "client_secret") {
          config.credentials.client_secret = value;
        } else if (key == "wait_seconds") {
          config.credentials.wait_seconds = static_cast<uint32_t>(std::stoul(value));
        }
      } else if (current_section == "outbound") {
        if (key == "token_url") {
          config.outbound.token_url = value;
        } else if (key == "target_audience") {
          config.outbound.target_audience = value;
        } else if (key == "target_scopes") {
          config.outbound.target_scopes = value;
        } else if (key == "on_exchange_failure") {
          config.outbound.on_exchange_failure = ParseExchangeFailurePolicy(value);
        } else if (key == "timeout_ms") {
          config.outbound.timeout_ms = static_cast<uint32_t>(std::stoul(value));
        }
      } else if (current_section == "inbound") {
        if (key == "issuer") {
          config.inbound.issuer = value;
        } else if (key == "expected_audience") {
          config.inbound.expected_audience = value;
        } else if (key == "jwks_url") {
          config.inbound.jwks_url = value;
        } else if (key == "jwks_refresh_seconds") {
          config.inbound.jwks_refresh_seconds = static_cast<uint32_t>(std::stoul(value));
        } else if (key == "jwks_min_refresh_seconds") {
          config.inbound.jwks_min_refresh_seconds = static_cast<uint32_t>(std::stoul(value));
        } else if (key == "leeway_seconds") {
          config.inbound.leeway_seconds = std::stoll(value);
        } else if (key == "timeout_ms") {
          config.inbound.timeout_ms = static_cast<uint32_t>(std::stoul(value));
        }
      } else if (current_section == "tracing") {
        if (key == "enabled") {
          config.tracing.enabled = ParseBool(value);
        } else if (key == "endpoint") {
          config.tracing.endpoint = value;
        } else if (key == "service_name") {
          config.tracing.service_name = value;
        } else if (key == "agent_name") {
          config.tracing.agent_name = value;
        } else if (key == "agent_version") {
          config.tracing.agent_version = value;
        } else if (key == "agent_provider") {
          config.tracing.agent_provider = value;
        } else if (key == "max_attribute_length") {
          config.tracing.max_attribute_length = static_cast<uint32_t>(std::stoul(value));
        }
      } else if (current_section == "metrics") {
        if (key == "enabled") {
          config.metrics.enabled = ParseBool(value);
        } else if (key == "path") {
          config.metrics.path = value;
        }
      }
    } catch (const std::logic_error&) {
      // std::stoul and friends throw invalid_argument / out_of_range
      throw std::runtime_error("Invalid value for " + current_section + "." + key +
                               ": " + value);
    }
  }

  return config;
}

void Config::ApplyEnvironment(const EnvLookup& env) {
  std::string value;

  if (Lookup(env, "LOG_LEVEL", &value)) server.log_level = value;

  if (Lookup(env, "CLIENT_ID_FILE", &value)) credentials.client_id_file = value;
  if (Lookup(env, "CLIENT_SECRET_FILE", &value)) credentials.client_secret_file = value;
  if (Lookup(env, "CLIENT_ID", &value)) credentials.client_id = value;
  if (Lookup(env, "CLIENT_SECRET", &value)) credentials.client_secret = value;
  if (Lookup(env, "CREDENTIAL_WAIT_SECONDS", &value)) {
    try {
      credentials.wait_seconds = static_cast<uint32_t>(std::stoul(value));
    } catch (const std::logic_error&) {
      throw std::runtime_error("Invalid CREDENTIAL_WAIT_SECONDS: " + value);
    }
  }

  if (Lookup(env, "TOKEN_URL", &value)) outbound.token_url = value;
  if (Lookup(env, "TARGET_AUDIENCE", &value)) outbound.target_audience = value;
  if (Lookup(env, "TARGET_SCOPES", &value)) outbound.target_scopes = value;
  if (Lookup(env, "TOKEN_EXCHANGE_FAILURE_POLICY", &value)) {
    outbound.on_exchange_failure = ParseExchangeFailurePolicy(value);
  }

  if (Lookup(env, "ISSUER", &value)) inbound.issuer = value;
  if (Lookup(env, "EXPECTED_AUDIENCE", &value)) inbound.expected_audience = value;
  if (Lookup(env, "JWKS_URL", &value)) inbound.jwks_url = value;

  if (Lookup(env, "OTEL_TRACING_ENABLED", &value)) tracing.enabled = (value == "true");
  if (Lookup(env, "OTEL_EXPORTER_OTLP_ENDPOINT", &value)) tracing.endpoint = value;
  if (Lookup(env, "OTEL_SERVICE_NAME", &value)) tracing.service_name = value;
  if (Lookup(env, "AGENT_NAME", &value)) tracing.agent_name = value;
  if (Lookup(env, "AGENT_VERSION", &value)) tracing.agent_version = value;
  if (Lookup(env, "AGENT_PROVIDER", &value)) tracing.agent_provider = value;
}

Config Config::LoadFromArgs(int argc, char** argv, const EnvLookup& env) {
  // First pass: find the config file so CLI flags can override it.
  std::string config_file;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      if (++i >= argc) {
        throw std::runtime_error("--config requires a path argument");
      }
      config_file = argv[i];
    }
  }

  Config config = config_file.empty() ? Config() : LoadFromFile(config_file);
  if (env) {
    config.ApplyEnvironment(env);
  } else {
    config.ApplyEnvironment([](const char* name) -> const char* { return std::getenv(name); });
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" || arg == "-c") {
      ++i;
    } else if (arg == "--host") {
      if (++i >= argc) {
        throw std::runtime_error("--host requires an address argument");
      }
      config.server.host = argv[i];
    } else if (arg == "--port" || arg == "-p") {
      if (++i >= argc) {
        throw std::runtime_error("--port requires a port number");
      }
      config.server.port = ParsePort(argv[i]);
    } else if (arg == "--admin-port") {
      if (++i >= argc) {
        throw std::runtime_error("--admin-port requires a port number");
      }
      config.server.admin_port = ParsePort(argv[i]);
    } else if (arg == "--threads") {
      if (++i >= argc) {
        throw std::runtime_error("--threads requires a number");
      }
      config.server.threads = static_cast<uint32_t>(std::stoul(argv[i]));
    } else if (arg == "--token-url") {
      if (++i >= argc) {
        throw std::runtime_error("--token-url requires a URL");
      }
      config.outbound.token_url = argv[i];
    } else if (arg == "--issuer") {
      if (++i >= argc) {
        throw std::runtime_error("--issuer requires an issuer");
      }
      config.inbound.issuer = argv[i];
    } else if (arg == "--disable-tracing") {
      config.tracing.enabled = false;
    } else if (arg == "--log-level") {
      if (++i >= argc) {
        throw std::runtime_error("--log-level requires a level");
      }
      config.server.log_level = argv[i];
    } else if (arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  return config;
}

std::string Config::JwksUrl() const {
  if (!inbound.jwks_url.empty()) {
    return inbound.jwks_url;
  }
  if (outbound.token_url.empty()) {
    return "";
  }
  std::string base = outbound.token_url;
  if (internal::EndsWith(base, "/token")) {
    base.resize(base.size() - 6);
  }
  return base + "/certs";
}

bool Config::InboundValidationEnabled() const {
  return !inbound.issuer.empty() && !JwksUrl().empty();
}

void Config::Validate() const {
  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: " + std::to_string(server.port));
  }
  if (server.admin_port == 0 || server.admin_port == server.port) {
    throw std::runtime_error("Invalid admin_port: " + std::to_string(server.admin_port) +
                             " (must be non-zero and differ from port)");
  }

  // Validate log level
  if (server.log_level != "debug" && server.log_level != "info" &&
      server.log_level != "warn" && server.log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + server.log_level +
                             " (must be debug, info, warn, or error)");
  }

  if (credentials.wait_seconds == 0) {
    throw std::runtime_error("credentials.wait_seconds must be positive");
  }

  if (!inbound.issuer.empty() && JwksUrl().empty()) {
    throw std::runtime_error(
        "inbound.issuer is set but no JWKS URL is available (set inbound.jwks_url or "
        "outbound.token_url)");
  }
  if (inbound.leeway_seconds < 0) {
    throw std::runtime_error("inbound.leeway_seconds must not be negative");
  }

  if (tracing.enabled && tracing.max_attribute_length == 0) {
    throw std::runtime_error("tracing.max_attribute_length must be positive");
  }
}

}  // namespace authbridge::server
