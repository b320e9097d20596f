#include <authbridge/token_exchanger.hpp>
#include <authbridge/internal.hpp>

#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <exception>
#include <sstream>

namespace authbridge {

namespace {

ExchangeResult Failed(std::string message, int http_status = 0) {
  ExchangeResult result;
  result.error_message = std::move(message);
  result.http_status = http_status;
  return result;
}

}  // namespace

TokenExchanger::TokenExchanger(std::shared_ptr<HttpTransport> http,
                               CredentialsProvider credentials,
                               uint32_t timeout_ms,
                               std::shared_ptr<MetricsSink> metrics)
    : http_(std::move(http)),
      credentials_(std::move(credentials)),
      timeout_ms_(timeout_ms),
      metrics_(std::move(metrics)) {}

ExchangeResult TokenExchanger::Exchange(const std::string& subject_token,
                                        const std::string& audience,
                                        const std::string& scopes) const {
  ClientCredentials creds = credentials_ ? credentials_() : ClientCredentials{};
  if (!creds.Complete()) {
    EmitCounter(metrics_.get(), "authbridge_token_exchange_total{result=\"error\"}");
    return Failed("client credentials or token URL not configured");
  }

  FormFields fields = {
      {"grant_type", kGrantType},
      {"requested_token_type", kAccessTokenType},
      {"subject_token", subject_token},
      {"subject_token_type", kAccessTokenType},
      {"client_id", creds.client_id},
      {"client_secret", creds.client_secret},
      {"audience", audience},
      {"scope", scopes},
  };

  uint64_t start = internal::NowMicros();
  HttpResponse resp;
  try {
    resp = http_->PostForm(creds.token_url, fields, timeout_ms_);
  } catch (const std::exception& e) {
    resp.ok = false;
    resp.error_message = e.what();
  }
  EmitHistogram(metrics_.get(), "authbridge_token_exchange_latency_ms",
                (internal::NowMicros() - start) / 1000);

  ExchangeResult result;
  if (!resp.ok) {
    result = Failed("token exchange request failed: " + resp.error_message);
  } else if (resp.status_code < 200 || resp.status_code >= 300) {
    result = Failed("token exchange failed with status " + std::to_string(resp.status_code) +
                        ": " + internal::TruncateUtf8(resp.body, 256),
                    resp.status_code);
  } else {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream stream(resp.body);
    if (!Json::parseFromStream(builder, stream, &root, &errs) || !root.isObject()) {
      result = Failed("token endpoint returned invalid JSON", resp.status_code);
    } else if (!root.isMember("access_token") || !root["access_token"].isString() ||
               root["access_token"].asString().empty()) {
      result = Failed("token endpoint response has no access_token", resp.status_code);
    } else {
      result.success = true;
      result.http_status = resp.status_code;
      result.access_token = root["access_token"].asString();
    }
  }

  EmitCounter(metrics_.get(), result.success
                                  ? "authbridge_token_exchange_total{result=\"success\"}"
                                  : "authbridge_token_exchange_total{result=\"error\"}");
  return result;
}

}  // namespace authbridge
