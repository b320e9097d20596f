#include <authbridge/server/config_store.hpp>
#include <authbridge/internal.hpp>

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <mutex>
#include <thread>

namespace authbridge::server {

namespace {

constexpr std::chrono::milliseconds kInitialBackoff(250);
constexpr std::chrono::milliseconds kMaxBackoff(2000);

}  // namespace

std::string ReadTrimmedFile(const std::string& path) {
  if (path.empty()) return "";
  std::ifstream file(path);
  if (!file.is_open()) return "";
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  return internal::Trim(content);
}

ConfigStore::ConfigStore(CredentialsConfig credentials, OutboundConfig outbound)
    : sources_(std::move(credentials)), outbound_(std::move(outbound)) {
  Reload();
}

bool ConfigStore::FilesReady() const {
  return !ReadTrimmedFile(sources_.client_id_file).empty() &&
         !ReadTrimmedFile(sources_.client_secret_file).empty();
}

bool ConfigStore::WaitForCredentials(std::chrono::milliseconds max_wait) {
  auto deadline = std::chrono::steady_clock::now() + max_wait;
  auto backoff = kInitialBackoff;
  bool ready = FilesReady();

  if (!ready) {
    LOG_INFO << "[Config] Waiting up to " << max_wait.count()
             << " ms for credential files " << sources_.client_id_file << ", "
             << sources_.client_secret_file;
  }
  while (!ready) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) break;
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(backoff, remaining));
    backoff = std::min(backoff * 2, kMaxBackoff);
    ready = FilesReady();
  }

  if (ready) {
    LOG_INFO << "[Config] Credential files found";
  } else {
    LOG_WARN << "[Config] Credential files not available; using configured values";
  }
  Reload();
  return ready;
}

void ConfigStore::Reload() {
  CredentialSnapshot next;
  next.client_id = ReadTrimmedFile(sources_.client_id_file);
  if (next.client_id.empty()) next.client_id = sources_.client_id;
  next.client_secret = ReadTrimmedFile(sources_.client_secret_file);
  if (next.client_secret.empty()) next.client_secret = sources_.client_secret;
  next.token_url = outbound_.token_url;
  next.target_audience = outbound_.target_audience;
  next.target_scopes = outbound_.target_scopes;

  bool has_credentials = next.HasClientCredentials();
  std::string client_id = next.client_id;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    current_ = std::move(next);
  }

  if (has_credentials) {
    LOG_INFO << "[Config] Loaded client credentials (client_id=" << client_id << ")";
  } else {
    LOG_DEBUG << "[Config] No client credentials available";
  }
}

CredentialSnapshot ConfigStore::Snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return current_;
}

}  // namespace authbridge::server
