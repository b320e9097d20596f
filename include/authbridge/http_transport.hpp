#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>

namespace authbridge {

/** Result of a blocking HTTP call. */
struct HttpResponse {
  bool ok = false;          // transport succeeded (any status code)
  int status_code = 0;
  std::string body;
  std::string error_message;
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

/**
 * Blocking HTTP client used for identity-provider calls (JWKS fetch and
 * token exchange). Implementations must be safe to call from many threads.
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Get(const std::string& url, uint32_t timeout_ms) = 0;

  /** POST an application/x-www-form-urlencoded body. */
  virtual HttpResponse PostForm(const std::string& url,
                                const FormFields& fields,
                                uint32_t timeout_ms) = 0;
};

/**
 * Split "scheme://host[:port]/path?query" into the base
 * ("scheme://host[:port]") and the path ("/path?query", "/" when absent).
 * Returns false if the URL has no http(s) scheme or no host.
 */
bool SplitUrl(const std::string& url, std::string* base, std::string* path);

/**
 * HttpTransport backed by drogon's HttpClient.
 *
 * Clients run on a private event loop thread and are cached per base URL.
 * Calls use drogon's synchronous sendRequest, so they must not be made from
 * that loop thread (gRPC worker threads are fine).
 */
class DrogonHttpTransport : public HttpTransport {
 public:
  DrogonHttpTransport();
  ~DrogonHttpTransport() override;

  DrogonHttpTransport(const DrogonHttpTransport&) = delete;
  DrogonHttpTransport& operator=(const DrogonHttpTransport&) = delete;

  HttpResponse Get(const std::string& url, uint32_t timeout_ms) override;
  HttpResponse PostForm(const std::string& url,
                        const FormFields& fields,
                        uint32_t timeout_ms) override;

 private:
  drogon::HttpClientPtr ClientFor(const std::string& base);
  HttpResponse Send(const drogon::HttpClientPtr& client,
                    const drogon::HttpRequestPtr& req,
                    uint32_t timeout_ms);

  trantor::EventLoopThread loop_thread_;
  std::mutex mu_;
  std::unordered_map<std::string, drogon::HttpClientPtr> clients_;
};

}  // namespace authbridge
