#pragma once

#include <authbridge/http_transport.hpp>
#include <authbridge/observability.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace authbridge {

/** OAuth2 client identity and the token endpoint it talks to. */
struct ClientCredentials {
  std::string client_id;
  std::string client_secret;
  std::string token_url;

  bool Complete() const {
    return !client_id.empty() && !client_secret.empty() && !token_url.empty();
  }
};

/**
 * Token exchange result.
 */
struct ExchangeResult {
  bool success = false;
  std::string access_token;
  std::string error_message;
  int http_status = 0;  // 0 when the request never got a response
};

/**
 * RFC 8693 token exchange against an OAuth2 token endpoint.
 *
 * Credentials are read through a provider on every call so that rotated
 * client secrets take effect without a restart.
 */
class TokenExchanger {
 public:
  using CredentialsProvider = std::function<ClientCredentials()>;

  static constexpr const char* kGrantType =
      "urn:ietf:params:oauth:grant-type:token-exchange";
  static constexpr const char* kAccessTokenType =
      "urn:ietf:params:oauth:token-type:access_token";

  TokenExchanger(std::shared_ptr<HttpTransport> http,
                 CredentialsProvider credentials,
                 uint32_t timeout_ms = 10000,
                 std::shared_ptr<MetricsSink> metrics = nullptr);

  /**
   * Exchange `subject_token` for a token scoped to `audience`.
   * Never throws; failures are described in the result.
   */
  ExchangeResult Exchange(const std::string& subject_token,
                          const std::string& audience,
                          const std::string& scopes) const;

 private:
  std::shared_ptr<HttpTransport> http_;
  CredentialsProvider credentials_;
  uint32_t timeout_ms_;
  std::shared_ptr<MetricsSink> metrics_;
};

}  // namespace authbridge
