#include <authbridge/server/stream_processor.hpp>
#include <authbridge/internal.hpp>

#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <cstdlib>

namespace authbridge::server {

namespace {

constexpr const char* kMetricMessages = "authbridge_ext_proc_messages_total";

void SetHeader(ext_proc::HeaderMutation* mutation, const std::string& key,
               const std::string& value) {
  auto* option = mutation->add_set_headers();
  option->mutable_header()->set_key(key);
  option->mutable_header()->set_raw_value(value);
  option->set_append_action(envoy_core::HeaderValueOption::OVERWRITE_IF_EXISTS_OR_ADD);
}

// Reply that ends the request at the proxy with a JSON error body.
ext_proc::ProcessingResponse ImmediateError(envoy_type::StatusCode code,
                                            const std::string& error,
                                            const std::string& message) {
  Json::Value body;
  body["error"] = error;
  body["message"] = message;
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";

  ext_proc::ProcessingResponse response;
  auto* immediate = response.mutable_immediate_response();
  immediate->mutable_status()->set_code(code);
  immediate->set_body(Json::writeString(writer, body));
  immediate->set_details(error);
  SetHeader(immediate->mutable_headers(), "content-type", "application/json");
  return response;
}

void CountMessage(MetricsSink* metrics, const char* kind) {
  if (!metrics) return;
  metrics->Counter(std::string(kMetricMessages) + "{kind=\"" + kind + "\"}", 1);
}

}  // namespace

std::string GetHeader(const ext_proc::HttpHeaders& headers, const std::string& name) {
  for (const auto& header : headers.headers().headers()) {
    if (internal::EqualsIgnoreCase(header.key(), name)) {
      return header.raw_value().empty() ? header.value() : header.raw_value();
    }
  }
  return "";
}

StreamProcessor::StreamProcessor(ProcessorOptions options, ProcessorComponents components)
    : options_(std::move(options)), components_(std::move(components)) {}

StreamId StreamProcessor::OpenStream() {
  StreamId id = next_id_.fetch_add(1);
  size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    streams_.insert(id);
    active = streams_.size();
  }
  EmitCounter(components_.metrics.get(), "authbridge_ext_proc_streams_total");
  EmitGauge(components_.metrics.get(), "authbridge_active_streams", static_cast<double>(active));
  LOG_DEBUG << "[ext_proc] Stream " << id << " opened";
  return id;
}

void StreamProcessor::CloseStream(StreamId id, const std::string& reason) {
  std::unique_ptr<StreamState> state;
  bool known = false;
  size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    known = streams_.erase(id) > 0;
    active = streams_.size();
    auto it = states_.find(id);
    if (it != states_.end()) {
      state = std::move(it->second);
      states_.erase(it);
    }
  }

  if (state && components_.spans) {
    components_.spans->Abort(*state, reason);
  }
  if (known) {
    EmitGauge(components_.metrics.get(), "authbridge_active_streams", static_cast<double>(active));
    LOG_DEBUG << "[ext_proc] Stream " << id << " closed";
  }
}

size_t StreamProcessor::OpenSpanCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return states_.size();
}

size_t StreamProcessor::ActiveStreamCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return streams_.size();
}

StreamState* StreamProcessor::FindState(StreamId id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = states_.find(id);
  return it == states_.end() ? nullptr : it->second.get();
}

std::unique_ptr<StreamState> StreamProcessor::TakeState(StreamId id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = states_.find(id);
  if (it == states_.end()) return nullptr;
  auto state = std::move(it->second);
  states_.erase(it);
  return state;
}

void StreamProcessor::InsertState(StreamId id, std::unique_ptr<StreamState> state) {
  std::unique_ptr<StreamState> previous;
  {
    std::lock_guard<std::mutex> lock(mu_);
    previous = std::move(states_[id]);
    states_[id] = std::move(state);
  }
  if (previous && components_.spans) {
    components_.spans->Abort(*previous, "superseded by a new request on the same stream");
  }
}

void StreamProcessor::FinishStream(StreamId id) {
  auto state = TakeState(id);
  if (state && components_.spans) {
    components_.spans->Finish(*state);
  }
}

ext_proc::ProcessingResponse StreamProcessor::Process(StreamId id,
                                                      const ext_proc::ProcessingRequest& request) {
  MetricsSink* metrics = components_.metrics.get();
  ext_proc::ProcessingResponse response;

  switch (request.request_case()) {
    case ext_proc::ProcessingRequest::kRequestHeaders:
      CountMessage(metrics, "request_headers");
      return HandleRequestHeaders(id, request.request_headers());
    case ext_proc::ProcessingRequest::kRequestBody:
      CountMessage(metrics, "request_body");
      return HandleRequestBody(id, request.request_body());
    case ext_proc::ProcessingRequest::kResponseHeaders:
      CountMessage(metrics, "response_headers");
      return HandleResponseHeaders(id, request.response_headers());
    case ext_proc::ProcessingRequest::kResponseBody:
      CountMessage(metrics, "response_body");
      return HandleResponseBody(id, request.response_body());
    case ext_proc::ProcessingRequest::kRequestTrailers:
      CountMessage(metrics, "request_trailers");
      response.mutable_request_trailers();
      break;
    case ext_proc::ProcessingRequest::kResponseTrailers:
      CountMessage(metrics, "response_trailers");
      response.mutable_response_trailers();
      break;
    case ext_proc::ProcessingRequest::REQUEST_NOT_SET:
      CountMessage(metrics, "empty");
      LOG_WARN << "[ext_proc] Stream " << id << ": message without payload";
      break;
  }
  return response;
}

// --- Request headers ---

ext_proc::ProcessingResponse StreamProcessor::HandleRequestHeaders(
    StreamId id, const ext_proc::HttpHeaders& headers) {
  std::string direction = GetHeader(headers, kDirectionHeader);
  if (direction == "outbound") {
    return HandleOutbound(headers);
  }
  return HandleInbound(id, headers);
}

ext_proc::ProcessingResponse StreamProcessor::HandleInbound(StreamId id,
                                                            const ext_proc::HttpHeaders& headers) {
  std::string subject;
  if (components_.validator) {
    ValidationResult result = components_.validator->ValidateAuthorizationHeader(
        GetHeader(headers, "authorization"), options_.expected_issuer,
        options_.expected_audience);
    if (!result.ok) {
      LOG_WARN << "[Inbound] Denied (" << AuthErrorName(result.error) << "): " << result.message;
      EmitCounter(components_.metrics.get(), "authbridge_inbound_denied_total");
      return ImmediateError(envoy_type::Unauthorized, "unauthorized", result.message);
    }
    subject = result.subject;
    LOG_DEBUG << "[Inbound] Token validated (sub=" << subject << ")";
  }

  ext_proc::ProcessingResponse response;
  auto* mutation =
      response.mutable_request_headers()->mutable_response()->mutable_header_mutation();
  mutation->add_remove_headers(kDirectionHeader);

  SpanManager* spans = components_.spans.get();
  std::string path = GetHeader(headers, ":path");
  if (spans && spans->enabled() && SpanManager::IsObservablePath(path)) {
    auto state = spans->Open(subject);
    if (state) {
      for (const auto& [key, value] : spans->TraceHeaders(*state)) {
        SetHeader(mutation, key, value);
      }
      InsertState(id, std::move(state));
    }
  }
  return response;
}

ext_proc::ProcessingResponse StreamProcessor::HandleOutbound(const ext_proc::HttpHeaders& headers) {
  ext_proc::ProcessingResponse response;
  auto* mutation =
      response.mutable_request_headers()->mutable_response()->mutable_header_mutation();
  mutation->add_remove_headers(kDirectionHeader);

  if (!components_.config_store || !components_.exchanger) {
    return response;
  }

  CredentialSnapshot config = components_.config_store->Snapshot();
  if (!config.HasClientCredentials()) {
    // The credential sidecar may have finished after startup.
    components_.config_store->Reload();
    config = components_.config_store->Snapshot();
  }
  if (!config.ExchangeConfigured()) {
    LOG_DEBUG << "[Outbound] Token exchange not configured, passing through";
    return response;
  }

  std::string subject_token;
  if (!ExtractBearerToken(GetHeader(headers, "authorization"), &subject_token)) {
    LOG_DEBUG << "[Outbound] No bearer token, passing through";
    return response;
  }

  ExchangeResult result = components_.exchanger->Exchange(subject_token, config.target_audience,
                                                          config.target_scopes);
  if (result.success) {
    SetHeader(mutation, "authorization", "Bearer " + result.access_token);
    LOG_DEBUG << "[Outbound] Token exchanged for audience " << config.target_audience;
    return response;
  }

  if (options_.on_exchange_failure == ExchangeFailurePolicy::kDeny) {
    LOG_WARN << "[Outbound] Token exchange failed, denying request: " << result.error_message;
    return ImmediateError(envoy_type::ServiceUnavailable, "token_exchange_failed",
                          result.error_message);
  }
  LOG_WARN << "[Outbound] Token exchange failed, forwarding original token: "
           << result.error_message;
  return response;
}

// --- Bodies and response headers ---

ext_proc::ProcessingResponse StreamProcessor::HandleRequestBody(StreamId id,
                                                                const ext_proc::HttpBody& body) {
  StreamState* state = FindState(id);
  if (state && components_.spans) {
    components_.spans->OnRequestBody(*state, body.body(), body.end_of_stream());
  }

  ext_proc::ProcessingResponse response;
  response.mutable_request_body();
  return response;
}

ext_proc::ProcessingResponse StreamProcessor::HandleResponseHeaders(
    StreamId id, const ext_proc::HttpHeaders& headers) {
  StreamState* state = FindState(id);
  if (state && components_.spans) {
    std::string status = GetHeader(headers, ":status");
    if (!status.empty()) {
      int code = std::atoi(status.c_str());
      if (code > 0) {
        components_.spans->OnResponseStatus(*state, code);
      }
    }
    if (headers.end_of_stream()) {
      // No body will follow.
      FinishStream(id);
    }
  }

  ext_proc::ProcessingResponse response;
  response.mutable_response_headers();
  return response;
}

ext_proc::ProcessingResponse StreamProcessor::HandleResponseBody(StreamId id,
                                                                 const ext_proc::HttpBody& body) {
  StreamState* state = FindState(id);
  if (state && components_.spans) {
    components_.spans->OnResponseBody(*state, body.body());
    if (body.end_of_stream()) {
      FinishStream(id);
    }
  }

  ext_proc::ProcessingResponse response;
  response.mutable_response_body();
  return response;
}

}  // namespace authbridge::server
