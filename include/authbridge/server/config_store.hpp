#pragma once

#include <authbridge/server/config.hpp>
#include <authbridge/token_exchanger.hpp>

#include <chrono>
#include <shared_mutex>
#include <string>

namespace authbridge::server {

/**
 * Credential material and exchange target, as seen at one point in time.
 */
struct CredentialSnapshot {
  std::string client_id;
  std::string client_secret;
  std::string token_url;
  std::string target_audience;
  std::string target_scopes;

  bool HasClientCredentials() const {
    return !client_id.empty() && !client_secret.empty();
  }

  /** Client credentials, token URL and audience are all present. */
  bool ExchangeConfigured() const {
    return HasClientCredentials() && !token_url.empty() && !target_audience.empty();
  }

  ClientCredentials Client() const { return {client_id, client_secret, token_url}; }
};

/**
 * Owns the OAuth2 client credentials.
 *
 * The credential files are written by a sidecar that may start after us, so
 * startup waits for them (bounded) and the outbound path can ask for a
 * reload later. Readers take a shared lock; Reload takes it exclusively.
 */
class ConfigStore {
 public:
  ConfigStore(CredentialsConfig credentials, OutboundConfig outbound);

  /**
   * Poll the credential files until both are non-empty or `max_wait`
   * elapses (250 ms backoff doubling to 2 s). Then loads whatever is
   * available. Returns true if file credentials were found.
   */
  bool WaitForCredentials(std::chrono::milliseconds max_wait);

  /** Re-read the credential files, falling back to configured literals. */
  void Reload();

  CredentialSnapshot Snapshot() const;

 private:
  bool FilesReady() const;

  const CredentialsConfig sources_;
  const OutboundConfig outbound_;

  mutable std::shared_mutex mu_;
  CredentialSnapshot current_;
};

/** Contents of a file with surrounding whitespace removed; "" if unreadable. */
std::string ReadTrimmedFile(const std::string& path);

}  // namespace authbridge::server
