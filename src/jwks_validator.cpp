#include <authbridge/jwks_validator.hpp>
#include <authbridge/internal.hpp>

#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/param_build.h>

#include <exception>
#include <memory>
#include <sstream>

namespace authbridge {

namespace {

// Minimum spacing between fetch attempts while no keys are loaded at all.
constexpr auto kFailedFetchRetryInterval = std::chrono::seconds(1);

struct BnDeleter {
  void operator()(BIGNUM* bn) const { BN_free(bn); }
};
struct ParamBldDeleter {
  void operator()(OSSL_PARAM_BLD* bld) const { OSSL_PARAM_BLD_free(bld); }
};
struct ParamDeleter {
  void operator()(OSSL_PARAM* params) const { OSSL_PARAM_free(params); }
};
struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct EcdsaSigDeleter {
  void operator()(ECDSA_SIG* sig) const { ECDSA_SIG_free(sig); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, ParamBldDeleter>;
using ParamPtr = std::unique_ptr<OSSL_PARAM, ParamDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter>;

std::shared_ptr<EVP_PKEY> WrapPkey(EVP_PKEY* pkey) {
  return std::shared_ptr<EVP_PKEY>(pkey, [](EVP_PKEY* p) { EVP_PKEY_free(p); });
}

bool ParseJsonObject(std::string_view text, Json::Value* out) {
  Json::CharReaderBuilder builder;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), out, &errs)) {
    return false;
  }
  return out->isObject();
}

std::string StringMember(const Json::Value& obj, const char* key) {
  if (!obj.isObject() || !obj.isMember(key) || !obj[key].isString()) return "";
  return obj[key].asString();
}

BnPtr DecodeBignum(const std::string& b64url) {
  std::string raw;
  if (b64url.empty() || !internal::Base64UrlDecode(b64url, &raw) || raw.empty()) {
    return nullptr;
  }
  return BnPtr(BN_bin2bn(reinterpret_cast<const unsigned char*>(raw.data()),
                         static_cast<int>(raw.size()), nullptr));
}

std::shared_ptr<EVP_PKEY> FromParams(const char* type, OSSL_PARAM_BLD* bld) {
  ParamPtr params(OSSL_PARAM_BLD_to_param(bld));
  if (!params) return nullptr;
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, type, nullptr));
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) return nullptr;
  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY, params.get()) != 1) {
    return nullptr;
  }
  return WrapPkey(pkey);
}

std::shared_ptr<EVP_PKEY> RsaKeyFromJwk(const Json::Value& jwk) {
  BnPtr n = DecodeBignum(StringMember(jwk, "n"));
  BnPtr e = DecodeBignum(StringMember(jwk, "e"));
  if (!n || !e) return nullptr;

  ParamBldPtr bld(OSSL_PARAM_BLD_new());
  if (!bld ||
      OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) != 1 ||
      OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get()) != 1) {
    return nullptr;
  }
  return FromParams("RSA", bld.get());
}

std::shared_ptr<EVP_PKEY> EcKeyFromJwk(const Json::Value& jwk) {
  std::string crv = StringMember(jwk, "crv");
  const char* group = nullptr;
  size_t field_bytes = 0;
  if (crv == "P-256") {
    group = "prime256v1";
    field_bytes = 32;
  } else if (crv == "P-384") {
    group = "secp384r1";
    field_bytes = 48;
  } else {
    return nullptr;
  }

  std::string x;
  std::string y;
  if (!internal::Base64UrlDecode(StringMember(jwk, "x"), &x) ||
      !internal::Base64UrlDecode(StringMember(jwk, "y"), &y) ||
      x.empty() || y.empty() || x.size() > field_bytes || y.size() > field_bytes) {
    return nullptr;
  }

  // Uncompressed point: 0x04 || X || Y, each left-padded to the field size.
  std::string point(1 + 2 * field_bytes, '\0');
  point[0] = 0x04;
  point.replace(1 + field_bytes - x.size(), x.size(), x);
  point.replace(1 + 2 * field_bytes - y.size(), y.size(), y);

  ParamBldPtr bld(OSSL_PARAM_BLD_new());
  if (!bld ||
      OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, group, 0) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       point.data(), point.size()) != 1) {
    return nullptr;
  }
  return FromParams("EC", bld.get());
}

struct AlgorithmInfo {
  const EVP_MD* md = nullptr;
  const char* kty = nullptr;
  size_t ec_component_bytes = 0;  // 0 for RSA
};

bool LookupAlgorithm(const std::string& alg, AlgorithmInfo* info) {
  if (alg == "RS256") {
    *info = {EVP_sha256(), "RSA", 0};
  } else if (alg == "RS384") {
    *info = {EVP_sha384(), "RSA", 0};
  } else if (alg == "RS512") {
    *info = {EVP_sha512(), "RSA", 0};
  } else if (alg == "ES256") {
    *info = {EVP_sha256(), "EC", 32};
  } else if (alg == "ES384") {
    *info = {EVP_sha384(), "EC", 48};
  } else {
    return false;
  }
  return true;
}

// JWS ECDSA signatures are raw r || s; OpenSSL verifies DER.
bool EcdsaRawToDer(const std::string& raw, size_t component_bytes, std::string* der) {
  if (raw.size() != 2 * component_bytes) return false;
  const auto* bytes = reinterpret_cast<const unsigned char*>(raw.data());
  EcdsaSigPtr sig(ECDSA_SIG_new());
  if (!sig) return false;
  BIGNUM* r = BN_bin2bn(bytes, static_cast<int>(component_bytes), nullptr);
  BIGNUM* s = BN_bin2bn(bytes + component_bytes, static_cast<int>(component_bytes), nullptr);
  if (!r || !s || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
    BN_free(r);
    BN_free(s);
    return false;
  }
  int len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (len <= 0) return false;
  der->resize(static_cast<size_t>(len));
  auto* out = reinterpret_cast<unsigned char*>(&(*der)[0]);
  return i2d_ECDSA_SIG(sig.get(), &out) == len;
}

bool VerifySignature(const VerificationKey& key,
                     const AlgorithmInfo& info,
                     std::string_view signing_input,
                     const std::string& signature) {
  if (!key.pkey || !EVP_PKEY_is_a(key.pkey.get(), info.kty)) return false;

  std::string der;
  const std::string* sig = &signature;
  if (info.ec_component_bytes > 0) {
    if (!EcdsaRawToDer(signature, info.ec_component_bytes, &der)) return false;
    sig = &der;
  }

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, info.md, nullptr, key.pkey.get()) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(),
                          reinterpret_cast<const unsigned char*>(sig->data()), sig->size(),
                          reinterpret_cast<const unsigned char*>(signing_input.data()),
                          signing_input.size()) == 1;
}

ValidationResult Fail(AuthError error, std::string message) {
  ValidationResult result;
  result.error = error;
  result.message = std::move(message);
  return result;
}

bool AudienceMatches(const Json::Value& aud, const std::string& expected) {
  if (aud.isString()) return aud.asString() == expected;
  if (aud.isArray()) {
    for (const auto& entry : aud) {
      if (entry.isString() && entry.asString() == expected) return true;
    }
  }
  return false;
}

std::string DescribeAudience(const Json::Value& aud) {
  if (aud.isNull()) return "none";
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  return Json::writeString(writer, aud);
}

}  // namespace

const char* AuthErrorName(AuthError error) {
  switch (error) {
    case AuthError::kNone: return "none";
    case AuthError::kMissingHeader: return "missing_header";
    case AuthError::kMalformedBearer: return "malformed_bearer";
    case AuthError::kMalformedToken: return "malformed_token";
    case AuthError::kUnsupportedAlgorithm: return "unsupported_algorithm";
    case AuthError::kKeySetUnavailable: return "key_set_unavailable";
    case AuthError::kUnknownKey: return "unknown_key";
    case AuthError::kInvalidSignature: return "invalid_signature";
    case AuthError::kExpired: return "expired";
    case AuthError::kNotYetValid: return "not_yet_valid";
    case AuthError::kIssuerMismatch: return "issuer_mismatch";
    case AuthError::kAudienceMismatch: return "audience_mismatch";
  }
  return "unknown";
}

bool ExtractBearerToken(std::string_view header, std::string* token) {
  for (std::string_view prefix : {std::string_view("Bearer "), std::string_view("bearer ")}) {
    if (internal::StartsWith(header, prefix)) {
      *token = std::string(header.substr(prefix.size()));
      return true;
    }
  }
  return false;
}

bool ParseJwks(std::string_view json, KeySet* out) {
  Json::Value root;
  if (!ParseJsonObject(json, &root) || !root.isMember("keys") || !root["keys"].isArray()) {
    return false;
  }

  out->clear();
  for (const auto& jwk : root["keys"]) {
    if (!jwk.isObject()) continue;
    std::string use = StringMember(jwk, "use");
    if (!use.empty() && use != "sig") continue;

    VerificationKey key;
    key.kid = StringMember(jwk, "kid");
    key.kty = StringMember(jwk, "kty");
    key.alg = StringMember(jwk, "alg");
    if (key.kty == "RSA") {
      key.pkey = RsaKeyFromJwk(jwk);
    } else if (key.kty == "EC") {
      key.pkey = EcKeyFromJwk(jwk);
    }
    if (!key.pkey) {
      LOG_DEBUG << "[JWKS] Skipping key kid=" << key.kid << " kty=" << key.kty;
      continue;
    }
    out->push_back(std::move(key));
  }
  return true;
}

// --- JwksCache ---

JwksCache::JwksCache(std::shared_ptr<HttpTransport> http,
                     JwksCacheOptions options,
                     std::shared_ptr<MetricsSink> metrics)
    : http_(std::move(http)), options_(options), metrics_(std::move(metrics)) {}

uint64_t JwksCache::FetchCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return fetch_count_;
}

std::shared_ptr<const KeySet> JwksCache::Fetch(const std::string& url) {
  HttpResponse resp = http_->Get(url, options_.timeout_ms);
  if (!resp.ok) {
    LOG_WARN << "[JWKS] Fetch from " << url << " failed: " << resp.error_message;
    EmitCounter(metrics_.get(), "authbridge_jwks_fetch_total{result=\"error\"}");
    return nullptr;
  }
  if (resp.status_code < 200 || resp.status_code >= 300) {
    LOG_WARN << "[JWKS] Fetch from " << url << " returned status " << resp.status_code;
    EmitCounter(metrics_.get(), "authbridge_jwks_fetch_total{result=\"error\"}");
    return nullptr;
  }

  auto keys = std::make_shared<KeySet>();
  if (!ParseJwks(resp.body, keys.get())) {
    LOG_WARN << "[JWKS] Response from " << url << " is not a JWKS document";
    EmitCounter(metrics_.get(), "authbridge_jwks_fetch_total{result=\"error\"}");
    return nullptr;
  }

  LOG_INFO << "[JWKS] Loaded " << keys->size() << " key(s) from " << url;
  EmitCounter(metrics_.get(), "authbridge_jwks_fetch_total{result=\"success\"}");
  return keys;
}

std::shared_ptr<const KeySet> JwksCache::Get(const std::string& url, bool force_refresh) {
  using Clock = std::chrono::steady_clock;

  std::unique_lock<std::mutex> lock(mu_);
  auto& slot = entries_[url];
  if (!slot) {
    slot = std::make_unique<Entry>();
  }
  Entry& entry = *slot;

  auto now = Clock::now();
  bool expired = !entry.keys ||
                 now - entry.fetched_at >= std::chrono::seconds(options_.refresh_seconds);
  bool forced = force_refresh && entry.attempted &&
                now - entry.last_attempt >= std::chrono::seconds(options_.min_refresh_seconds);
  if (!expired && !forced) {
    return entry.keys;
  }

  if (entry.fetching) {
    if (entry.keys) {
      return entry.keys;
    }
    entry.cv.wait(lock, [&entry] { return !entry.fetching; });
    return entry.keys;
  }

  if (!entry.keys && entry.attempted && now - entry.last_attempt < kFailedFetchRetryInterval) {
    return nullptr;
  }

  entry.fetching = true;
  entry.attempted = true;
  entry.last_attempt = now;
  lock.unlock();

  std::shared_ptr<const KeySet> fetched;
  try {
    fetched = Fetch(url);
  } catch (const std::exception& e) {
    LOG_WARN << "[JWKS] Fetch from " << url << " threw: " << e.what();
  }

  lock.lock();
  entry.fetching = false;
  ++fetch_count_;
  if (fetched) {
    entry.keys = std::move(fetched);
    entry.fetched_at = Clock::now();
  }
  entry.cv.notify_all();
  return entry.keys;
}

// --- JwksValidator ---

JwksValidator::JwksValidator(std::shared_ptr<JwksCache> cache, JwksValidatorOptions options)
    : cache_(std::move(cache)), options_(std::move(options)) {}

ValidationResult JwksValidator::ValidateAuthorizationHeader(
    std::string_view header,
    const std::string& expected_issuer,
    const std::string& expected_audience) {
  if (header.empty()) {
    return Fail(AuthError::kMissingHeader, "missing Authorization header");
  }
  std::string token;
  if (!ExtractBearerToken(header, &token)) {
    return Fail(AuthError::kMalformedBearer, "invalid Authorization header format");
  }
  return Validate(token, expected_issuer, expected_audience);
}

ValidationResult JwksValidator::Validate(std::string_view token,
                                         const std::string& expected_issuer,
                                         const std::string& expected_audience) {
  // header.payload.signature
  size_t first_dot = token.find('.');
  size_t second_dot =
      first_dot == std::string_view::npos ? first_dot : token.find('.', first_dot + 1);
  if (first_dot == std::string_view::npos || second_dot == std::string_view::npos ||
      token.find('.', second_dot + 1) != std::string_view::npos) {
    return Fail(AuthError::kMalformedToken, "token is not a compact JWS");
  }

  std::string header_json;
  std::string payload_json;
  std::string signature;
  if (!internal::Base64UrlDecode(token.substr(0, first_dot), &header_json) ||
      !internal::Base64UrlDecode(token.substr(first_dot + 1, second_dot - first_dot - 1),
                                 &payload_json) ||
      !internal::Base64UrlDecode(token.substr(second_dot + 1), &signature)) {
    return Fail(AuthError::kMalformedToken, "token segment is not base64url");
  }

  Json::Value header;
  Json::Value claims;
  if (!ParseJsonObject(header_json, &header) || !ParseJsonObject(payload_json, &claims)) {
    return Fail(AuthError::kMalformedToken, "token header or payload is not a JSON object");
  }

  std::string alg = StringMember(header, "alg");
  AlgorithmInfo algorithm;
  if (!LookupAlgorithm(alg, &algorithm)) {
    return Fail(AuthError::kUnsupportedAlgorithm,
                "unsupported signing algorithm: " + (alg.empty() ? "none" : alg));
  }
  std::string kid = StringMember(header, "kid");

  auto keys = cache_->Get(options_.jwks_url);
  if (!keys) {
    return Fail(AuthError::kKeySetUnavailable,
                "failed to fetch JWKS from " + options_.jwks_url);
  }

  auto find_candidates = [&](const KeySet& set) {
    std::vector<const VerificationKey*> found;
    for (const auto& key : set) {
      if (key.kty != algorithm.kty) continue;
      if (!key.alg.empty() && key.alg != alg) continue;
      if (!kid.empty() && key.kid != kid) continue;
      found.push_back(&key);
    }
    return found;
  };

  auto candidates = find_candidates(*keys);
  if (candidates.empty() && !kid.empty()) {
    // Key rotation: the IdP may have published a key we have not seen yet.
    auto refreshed = cache_->Get(options_.jwks_url, true);
    if (refreshed) {
      keys = refreshed;
      candidates = find_candidates(*keys);
    }
  }
  if (candidates.empty()) {
    return Fail(AuthError::kUnknownKey,
                "no matching key for kid=" + (kid.empty() ? std::string("<none>") : kid));
  }

  std::string_view signing_input = token.substr(0, second_dot);
  bool verified = false;
  for (const auto* key : candidates) {
    if (VerifySignature(*key, algorithm, signing_input, signature)) {
      verified = true;
      break;
    }
  }
  if (!verified) {
    return Fail(AuthError::kInvalidSignature, "signature verification failed");
  }

  int64_t now = internal::WallClockSeconds();
  if (claims.isMember("exp")) {
    if (!claims["exp"].isNumeric()) {
      return Fail(AuthError::kMalformedToken, "exp claim is not numeric");
    }
    auto exp = static_cast<int64_t>(claims["exp"].asDouble());
    if (now > exp + options_.leeway_seconds) {
      return Fail(AuthError::kExpired, "token is expired");
    }
  }
  if (claims.isMember("nbf")) {
    if (!claims["nbf"].isNumeric()) {
      return Fail(AuthError::kMalformedToken, "nbf claim is not numeric");
    }
    auto nbf = static_cast<int64_t>(claims["nbf"].asDouble());
    if (now + options_.leeway_seconds < nbf) {
      return Fail(AuthError::kNotYetValid, "token is not valid yet");
    }
  }

  std::string issuer = StringMember(claims, "iss");
  if (issuer != expected_issuer) {
    return Fail(AuthError::kIssuerMismatch,
                "invalid issuer: expected " + expected_issuer + ", got " + issuer);
  }

  if (!expected_audience.empty()) {
    const Json::Value& aud = claims.isMember("aud") ? claims["aud"] : Json::Value::nullSingleton();
    if (!AudienceMatches(aud, expected_audience)) {
      return Fail(AuthError::kAudienceMismatch,
                  "invalid audience: expected " + expected_audience + ", got " +
                      DescribeAudience(aud));
    }
  }

  ValidationResult result;
  result.ok = true;
  result.subject = StringMember(claims, "sub");
  return result;
}

}  // namespace authbridge
