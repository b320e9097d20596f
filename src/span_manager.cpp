#include <authbridge/span_manager.hpp>
#include <authbridge/internal.hpp>

#include <trantor/utils/Logger.h>

#include <exception>

namespace authbridge {

namespace {

// Run a tracing call on an open span. A throwing backend loses the span.
template <typename Fn>
void Guarded(StreamState& state, const char* what, Fn&& fn) {
  if (state.closed || !state.span) return;
  try {
    fn(*state.span);
  } catch (const std::exception& e) {
    LOG_WARN << "[OTEL] " << what << " failed, dropping span: " << e.what();
    state.closed = true;
    state.span.reset();
  }
}

}  // namespace

SpanManager::SpanManager(std::shared_ptr<Tracer> tracer,
                         SpanManagerOptions options,
                         std::shared_ptr<EventClassifier> classifier,
                         std::shared_ptr<MetricsSink> metrics)
    : tracer_(std::move(tracer)),
      options_(std::move(options)),
      classifier_(std::move(classifier)),
      metrics_(std::move(metrics)) {
  if (!classifier_) {
    classifier_ = std::make_shared<StepMarkerClassifier>();
  }
}

bool SpanManager::IsObservablePath(std::string_view path) {
  return path == "/" || internal::StartsWith(path, "/?");
}

std::unique_ptr<StreamState> SpanManager::Open(std::string_view enduser_id) {
  if (!tracer_) return nullptr;

  auto state = std::make_unique<StreamState>();
  try {
    state->span = tracer_->StartSpan("invoke_agent " + options_.agent_name);
  } catch (const std::exception& e) {
    LOG_WARN << "[OTEL] Cannot start root span: " << e.what();
    return nullptr;
  }
  if (!state->span) return nullptr;

  Guarded(*state, "set root attributes", [&](TraceSpan& span) {
    span.SetAttribute("gen_ai.operation.name", "invoke_agent");
    span.SetAttribute("gen_ai.provider.name", options_.agent_provider);
    span.SetAttribute("gen_ai.agent.name", options_.agent_name);
    span.SetAttribute("gen_ai.agent.version", options_.agent_version);
    span.SetAttribute("mlflow.spanType", "AGENT");
    span.SetAttribute("openinference.span.kind", "AGENT");
    if (!enduser_id.empty()) {
      span.SetAttribute("enduser.id", enduser_id);
    }
  });
  if (state->closed) return nullptr;

  EmitCounter(metrics_.get(), "authbridge_spans_started_total");
  LOG_DEBUG << "[OTEL] Started root span invoke_agent " << options_.agent_name;
  return state;
}

ContextHeaders SpanManager::TraceHeaders(const StreamState& state) const {
  if (state.closed || !state.span) return {};
  try {
    return state.span->InjectContext();
  } catch (const std::exception& e) {
    LOG_WARN << "[OTEL] Cannot inject trace context: " << e.what();
    return {};
  }
}

void SpanManager::OnRequestBody(StreamState& state, std::string_view chunk, bool end_of_stream) {
  if (state.closed || state.request_enriched) return;

  if (end_of_stream && state.request_body.empty()) {
    state.request_enriched = true;
    EnrichFrom(state, chunk);
    return;
  }

  if (state.request_body.size() + chunk.size() > options_.max_response_buffer_bytes) {
    LOG_WARN << "[OTEL] Request body too large to inspect";
    state.request_enriched = true;
    state.request_body.clear();
    return;
  }
  state.request_body.append(chunk.data(), chunk.size());

  if (end_of_stream) {
    state.request_enriched = true;
    std::string body = std::move(state.request_body);
    state.request_body.clear();
    EnrichFrom(state, body);
  }
}

void SpanManager::EnrichFrom(StreamState& state, std::string_view body) {
  ParsedAgentRequest request = ParseAgentRequest(body);
  if (!request.valid) {
    LOG_DEBUG << "[OTEL] Request body is not a JSON object (" << body.size() << " bytes)";
    return;
  }
  Enrich(state, request);
}

void SpanManager::Enrich(StreamState& state, const ParsedAgentRequest& request) {
  if (!request.user_input.empty()) {
    std::string input = internal::TruncateUtf8(request.user_input, options_.max_attribute_length);
    Guarded(state, "set input", [&](TraceSpan& span) {
      span.SetAttribute("gen_ai.prompt", input);
      span.SetAttribute("input.value", input);
    });
  }
  if (!request.conversation_id.empty()) {
    SetConversationId(state, request.conversation_id);
  }
  LOG_DEBUG << "[OTEL] Request enriched (method=" << request.method
            << ", input " << request.user_input.size() << " bytes)";
}

void SpanManager::OnResponseStatus(StreamState& state, int status_code) {
  if (state.closed) return;
  state.response_status = status_code;
  Guarded(state, "set status code", [&](TraceSpan& span) {
    span.SetAttribute("http.response.status_code", static_cast<int64_t>(status_code));
  });
}

void SpanManager::OnResponseBody(StreamState& state, std::string_view chunk) {
  if (state.closed || !state.span) return;

  if (!state.response_body_truncated) {
    if (state.response_body.size() + chunk.size() > options_.max_response_buffer_bytes) {
      state.response_body_truncated = true;
      LOG_WARN << "[OTEL] Response exceeds " << options_.max_response_buffer_bytes
               << " bytes; fallback output extraction disabled";
    } else {
      state.response_body.append(chunk.data(), chunk.size());
    }
  }

  for (const auto& payload : state.sse.Feed(chunk)) {
    HandleEvent(state, payload);
  }
}

void SpanManager::HandleEvent(StreamState& state, const std::string& payload) {
  if (state.closed) return;
  Json::Value event;
  if (!ParseJson(payload, &event)) return;

  std::string context_id = ExtractContextId(event);
  if (!context_id.empty() && !state.has_conversation_id) {
    SetConversationId(state, context_id);
  }

  ClassifiedEvent classified = classifier_->Classify(event);
  switch (classified.category) {
    case EventCategory::kLlm:
    case EventCategory::kTool:
      StartChildSpan(state, classified);
      break;
    case EventCategory::kArtifact:
      if (!classified.text.empty()) {
        SetOutput(state, classified.text);
      }
      break;
    case EventCategory::kStatus:
    case EventCategory::kUnclassified:
      break;
  }
}

void SpanManager::StartChildSpan(StreamState& state, const ClassifiedEvent& event) {
  int64_t index = ++state.child_index;
  StepDetails details = ExtractStepDetails(event.category, event.text);
  bool llm = event.category == EventCategory::kLlm;

  Guarded(state, "record child span", [&](TraceSpan& root) {
    std::unique_ptr<TraceSpan> child = root.StartChild(details.span_name);
    if (!child) return;
    child->SetAttribute("gen_ai.operation.name", llm ? "chat" : "execute_tool");
    if (llm) {
      child->SetAttribute("gen_ai.system", options_.agent_provider);
    }
    for (const auto& [key, value] : details.string_attributes) {
      child->SetAttribute(key, value);
    }
    for (const auto& [key, value] : details.int_attributes) {
      child->SetAttribute(key, value);
    }
    child->SetAttribute("event.index", index);
    child->SetAttribute("event.text",
                        internal::TruncateUtf8(event.text, options_.max_attribute_length));
    child->End(SpanStatus::kOk, "");
  });

  EmitCounter(metrics_.get(), "authbridge_child_spans_total");
  LOG_DEBUG << "[OTEL] Child span " << details.span_name << " (step " << index << ")";
}

void SpanManager::SetOutput(StreamState& state, const std::string& output) {
  std::string value = internal::TruncateUtf8(output, options_.max_attribute_length);
  Guarded(state, "set output", [&](TraceSpan& span) {
    span.SetAttribute("gen_ai.completion", value);
    span.SetAttribute("output.value", value);
  });
  state.has_output = true;
}

void SpanManager::SetConversationId(StreamState& state, const std::string& id) {
  std::string value = internal::TruncateUtf8(id, options_.max_attribute_length);
  Guarded(state, "set conversation id", [&](TraceSpan& span) {
    span.SetAttribute("gen_ai.conversation.id", value);
    span.SetAttribute("mlflow.trace.session", value);
  });
  state.has_conversation_id = true;
}

void SpanManager::Finish(StreamState& state) {
  if (state.closed || !state.span) return;

  // Request body that never saw end_of_stream (trailers followed it).
  if (!state.request_enriched && !state.request_body.empty()) {
    state.request_enriched = true;
    std::string body = std::move(state.request_body);
    state.request_body.clear();
    EnrichFrom(state, body);
  }

  for (const auto& payload : state.sse.Finish()) {
    HandleEvent(state, payload);
  }

  if (!state.has_output && !state.response_body_truncated) {
    ParsedAgentResponse response = ParseAgentResponse(state.response_body);
    if (!response.output.empty()) {
      SetOutput(state, response.output);
    }
  }

  if (state.response_status >= 500) {
    Close(state, SpanStatus::kError,
          "agent returned HTTP " + std::to_string(state.response_status));
  } else {
    Close(state, SpanStatus::kOk, "");
  }
}

void SpanManager::Abort(StreamState& state, std::string_view reason) {
  if (state.closed || !state.span) return;
  LOG_WARN << "[OTEL] Closing span early: " << std::string(reason);
  Close(state, SpanStatus::kError, reason);
}

void SpanManager::Close(StreamState& state, SpanStatus status, std::string_view description) {
  bool ended = false;
  Guarded(state, "end span", [&](TraceSpan& span) {
    span.End(status, description);
    ended = true;
  });
  state.closed = true;
  state.span.reset();
  state.response_body.clear();

  if (ended) {
    EmitCounter(metrics_.get(), status == SpanStatus::kError
                                    ? "authbridge_spans_closed_total{status=\"error\"}"
                                    : "authbridge_spans_closed_total{status=\"ok\"}");
    LOG_DEBUG << "[OTEL] Root span ended (" << state.child_index << " child spans)";
  }
}

}  // namespace authbridge
