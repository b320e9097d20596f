#pragma once

#include <authbridge/http_transport.hpp>
#include <authbridge/observability.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

namespace authbridge {

/** Why a bearer token was rejected. */
enum class AuthError {
  kNone,
  kMissingHeader,
  kMalformedBearer,
  kMalformedToken,
  kUnsupportedAlgorithm,
  kKeySetUnavailable,
  kUnknownKey,
  kInvalidSignature,
  kExpired,
  kNotYetValid,
  kIssuerMismatch,
  kAudienceMismatch
};

const char* AuthErrorName(AuthError error);

/** Outcome of validating one token. `subject` is the `sub` claim on success. */
struct ValidationResult {
  bool ok = false;
  AuthError error = AuthError::kNone;
  std::string message;
  std::string subject;
};

/** A public key parsed from a JWK. */
struct VerificationKey {
  std::string kid;
  std::string kty;  // "RSA" or "EC"
  std::string alg;  // optional, from the JWK
  std::shared_ptr<EVP_PKEY> pkey;
};

using KeySet = std::vector<VerificationKey>;

/**
 * Parse a JWKS document ({"keys":[...]}) into verification keys.
 * Keys with unsupported types or bad parameters are skipped.
 * Returns false if the document is not a JWKS at all.
 */
bool ParseJwks(std::string_view json, KeySet* out);

struct JwksCacheOptions {
  // Keys older than this are refetched on the next lookup.
  uint32_t refresh_seconds = 3600;
  // Minimum spacing between forced refreshes (unknown kid).
  uint32_t min_refresh_seconds = 30;
  uint32_t timeout_ms = 10000;
};

/**
 * Key sets keyed by JWKS URL.
 *
 * Lookups are lazy: an expired or missing entry is fetched by the caller
 * that notices it. At most one fetch per URL is in flight; concurrent
 * callers use the stale keys if any, otherwise wait for that fetch. A failed
 * fetch keeps the previous keys.
 */
class JwksCache {
 public:
  JwksCache(std::shared_ptr<HttpTransport> http,
            JwksCacheOptions options,
            std::shared_ptr<MetricsSink> metrics = nullptr);

  /**
   * Keys for `url`, fetching if stale. `force_refresh` refetches even fresh
   * keys, subject to min_refresh_seconds. Returns nullptr if no keys could
   * ever be loaded.
   */
  std::shared_ptr<const KeySet> Get(const std::string& url, bool force_refresh = false);

  /** Number of completed network fetches (for tests and logging). */
  uint64_t FetchCount() const;

 private:
  struct Entry {
    std::shared_ptr<const KeySet> keys;
    std::chrono::steady_clock::time_point fetched_at;
    std::chrono::steady_clock::time_point last_attempt;
    bool attempted = false;
    bool fetching = false;
    std::condition_variable cv;
  };

  std::shared_ptr<const KeySet> Fetch(const std::string& url);

  std::shared_ptr<HttpTransport> http_;
  JwksCacheOptions options_;
  std::shared_ptr<MetricsSink> metrics_;

  mutable std::mutex mu_;
  std::map<std::string, std::unique_ptr<Entry>> entries_;
  uint64_t fetch_count_ = 0;
};

struct JwksValidatorOptions {
  std::string jwks_url;
  // Allowed clock skew for exp/nbf.
  int64_t leeway_seconds = 0;
};

/**
 * Validates compact-serialized JWTs against a JWKS endpoint.
 *
 * Supports RS256/RS384/RS512 and ES256/ES384. Checks the signature, exp and
 * nbf, exact issuer match and audience containment (when an expected
 * audience is given). Thread-safe.
 */
class JwksValidator {
 public:
  JwksValidator(std::shared_ptr<JwksCache> cache, JwksValidatorOptions options);

  /**
   * Validate an Authorization header value ("Bearer <jwt>").
   * A missing header or a missing bearer prefix is reported as such.
   */
  ValidationResult ValidateAuthorizationHeader(std::string_view header,
                                               const std::string& expected_issuer,
                                               const std::string& expected_audience);

  ValidationResult Validate(std::string_view token,
                            const std::string& expected_issuer,
                            const std::string& expected_audience);

  const std::string& jwks_url() const { return options_.jwks_url; }

 private:
  std::shared_ptr<JwksCache> cache_;
  JwksValidatorOptions options_;
};

/**
 * Strip a "Bearer " / "bearer " prefix. Returns false when the value does
 * not carry one.
 */
bool ExtractBearerToken(std::string_view header, std::string* token);

}  // namespace authbridge
