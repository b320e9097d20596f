#include <authbridge/http_transport.hpp>
#include <authbridge/internal.hpp>

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>

namespace authbridge {

bool SplitUrl(const std::string& url, std::string* base, std::string* path) {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) return false;
  std::string scheme = internal::ToLower(url.substr(0, scheme_end));
  if (scheme != "http" && scheme != "https") return false;

  size_t host_start = scheme_end + 3;
  size_t path_start = url.find_first_of("/?", host_start);
  if (path_start == host_start) return false;

  if (path_start == std::string::npos) {
    *base = url;
    *path = "/";
  } else {
    *base = url.substr(0, path_start);
    *path = url.substr(path_start);
    if ((*path)[0] == '?') {
      *path = "/" + *path;
    }
  }
  return true;
}

// --- DrogonHttpTransport ---

DrogonHttpTransport::DrogonHttpTransport() : loop_thread_("authbridge-http") {
  loop_thread_.run();
}

DrogonHttpTransport::~DrogonHttpTransport() {
  std::lock_guard<std::mutex> lock(mu_);
  clients_.clear();
}

drogon::HttpClientPtr DrogonHttpTransport::ClientFor(const std::string& base) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = clients_.find(base);
  if (it != clients_.end()) {
    return it->second;
  }
  auto client = drogon::HttpClient::newHttpClient(base, loop_thread_.getLoop());
  clients_.emplace(base, client);
  return client;
}

HttpResponse DrogonHttpTransport::Send(const drogon::HttpClientPtr& client,
                                       const drogon::HttpRequestPtr& req,
                                       uint32_t timeout_ms) {
  HttpResponse out;
  auto [result, resp] = client->sendRequest(req, timeout_ms / 1000.0);
  if (result != drogon::ReqResult::Ok || !resp) {
    out.error_message =
        "request failed (drogon result " + std::to_string(static_cast<int>(result)) + ")";
    return out;
  }
  out.ok = true;
  out.status_code = static_cast<int>(resp->statusCode());
  out.body = std::string(resp->body());
  return out;
}

HttpResponse DrogonHttpTransport::Get(const std::string& url, uint32_t timeout_ms) {
  std::string base;
  std::string path;
  if (!SplitUrl(url, &base, &path)) {
    HttpResponse out;
    out.error_message = "invalid URL: " + url;
    return out;
  }

  auto req = drogon::HttpRequest::newHttpRequest();
  req->setMethod(drogon::Get);
  req->setPathEncode(false);
  req->setPath(path);
  req->addHeader("Accept", "application/json");
  return Send(ClientFor(base), req, timeout_ms);
}

HttpResponse DrogonHttpTransport::PostForm(const std::string& url,
                                           const FormFields& fields,
                                           uint32_t timeout_ms) {
  std::string base;
  std::string path;
  if (!SplitUrl(url, &base, &path)) {
    HttpResponse out;
    out.error_message = "invalid URL: " + url;
    return out;
  }

  auto req = drogon::HttpRequest::newHttpFormPostRequest();
  req->setPathEncode(false);
  req->setPath(path);
  req->addHeader("Accept", "application/json");
  for (const auto& [name, value] : fields) {
    req->setParameter(name, value);
  }
  return Send(ClientFor(base), req, timeout_ms);
}

}  // namespace authbridge
