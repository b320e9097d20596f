#pragma once

#include <authbridge/a2a_parser.hpp>
#include <authbridge/event_classifier.hpp>
#include <authbridge/observability.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace authbridge {

/**
 * Per-request trace state, owned by whoever tracks the request (one
 * ext_proc stream). Only the SpanManager mutates it.
 */
struct StreamState {
  std::unique_ptr<TraceSpan> span;
  std::string request_body;
  std::string response_body;
  SseLineBuffer sse;
  int64_t child_index = 0;
  int response_status = 0;
  bool request_enriched = false;
  bool has_output = false;
  bool has_conversation_id = false;
  bool response_body_truncated = false;
  bool closed = false;
};

struct SpanManagerOptions {
  std::string agent_name = "weather-assistant";
  std::string agent_version = "1.0.0";
  std::string agent_provider = "langchain";

  // String attributes are cut to this many bytes (UTF-8 safe).
  size_t max_attribute_length = 1000;

  // Response bytes kept for the end-of-stream fallback extraction.
  size_t max_response_buffer_bytes = 8 * 1024 * 1024;
};

/**
 * Builds one agent-invocation trace per request from the traffic alone.
 *
 *   Open()          root span "invoke_agent {agent}" with static attributes
 *   OnRequestBody() prompt and conversation id
 *   OnResponseBody() child span per LLM/tool step, output per artifact
 *   Finish()        fallback output, status OK
 *   Abort()         status ERROR
 *
 * Every span that is opened is closed exactly once; calls on a closed state
 * are no-ops. Tracing errors are logged and never propagate.
 */
class SpanManager {
 public:
  SpanManager(std::shared_ptr<Tracer> tracer,
              SpanManagerOptions options,
              std::shared_ptr<EventClassifier> classifier = nullptr,
              std::shared_ptr<MetricsSink> metrics = nullptr);

  /** Only the agent's JSON-RPC endpoint ("/" or "/?...") is traced. */
  static bool IsObservablePath(std::string_view path);

  bool enabled() const { return tracer_ != nullptr; }

  /**
   * Open the root span. Returns nullptr when tracing is disabled or the
   * tracer failed. `enduser_id` is the validated token subject, if any.
   */
  std::unique_ptr<StreamState> Open(std::string_view enduser_id);

  /** Trace-context headers to inject into the forwarded request. */
  ContextHeaders TraceHeaders(const StreamState& state) const;

  /**
   * Buffer a request body chunk. The body is parsed once, on the chunk that
   * carries end_of_stream (or in Finish() if that never arrives).
   */
  void OnRequestBody(StreamState& state, std::string_view chunk, bool end_of_stream = true);

  /** Attach the parsed request to the root span. */
  void Enrich(StreamState& state, const ParsedAgentRequest& request);

  /** Record the upstream HTTP status (5xx closes as error in Finish). */
  void OnResponseStatus(StreamState& state, int status_code);

  void OnResponseBody(StreamState& state, std::string_view chunk);

  /** Normal end of the response. */
  void Finish(StreamState& state);

  /** The stream ended before the response completed. */
  void Abort(StreamState& state, std::string_view reason);

 private:
  void EnrichFrom(StreamState& state, std::string_view body);
  void HandleEvent(StreamState& state, const std::string& payload);
  void StartChildSpan(StreamState& state, const ClassifiedEvent& event);
  void SetOutput(StreamState& state, const std::string& output);
  void SetConversationId(StreamState& state, const std::string& id);
  void Close(StreamState& state, SpanStatus status, std::string_view description);

  std::shared_ptr<Tracer> tracer_;
  SpanManagerOptions options_;
  std::shared_ptr<EventClassifier> classifier_;
  std::shared_ptr<MetricsSink> metrics_;
};

}  // namespace authbridge
