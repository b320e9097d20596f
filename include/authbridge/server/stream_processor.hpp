#pragma once

#include <authbridge/jwks_validator.hpp>
#include <authbridge/observability.hpp>
#include <authbridge/server/config.hpp>
#include <authbridge/server/config_store.hpp>
#include <authbridge/span_manager.hpp>
#include <authbridge/token_exchanger.hpp>

#include <envoy/service/ext_proc/v3/external_processor.pb.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace authbridge::server {

namespace ext_proc = envoy::service::ext_proc::v3;
namespace envoy_core = envoy::config::core::v3;
namespace envoy_type = envoy::type::v3;

/** Identifies one ext_proc stream (one proxied HTTP request). */
using StreamId = uint64_t;

/** Internal routing marker set by the proxy on outbound requests. */
inline constexpr const char* kDirectionHeader = "x-authbridge-direction";

struct ProcessorOptions {
  std::string expected_issuer;
  std::string expected_audience;
  ExchangeFailurePolicy on_exchange_failure = ExchangeFailurePolicy::kForward;
};

/**
 * Collaborators of the processor. Any of them may be null:
 *   validator     null -> inbound requests are not authenticated
 *   config_store  null -> outbound requests pass through unchanged
 *   exchanger     null -> outbound requests pass through unchanged
 *   spans         null -> no tracing
 */
struct ProcessorComponents {
  std::shared_ptr<JwksValidator> validator;
  std::shared_ptr<ConfigStore> config_store;
  std::shared_ptr<TokenExchanger> exchanger;
  std::shared_ptr<SpanManager> spans;
  std::shared_ptr<MetricsSink> metrics;
};

/**
 * Turns ext_proc messages into replies and owns the per-stream trace state.
 *
 * Every message gets exactly one reply. The state table maps StreamId to
 * StreamState; its mutex guards only lookup/insert/erase. A stream's state
 * is mutated only by the worker that owns that stream, so Process() and
 * CloseStream() for one id must come from a single thread.
 */
class StreamProcessor {
 public:
  StreamProcessor(ProcessorOptions options, ProcessorComponents components);

  StreamProcessor(const StreamProcessor&) = delete;
  StreamProcessor& operator=(const StreamProcessor&) = delete;

  /** Register a new stream. */
  StreamId OpenStream();

  ext_proc::ProcessingResponse Process(StreamId id, const ext_proc::ProcessingRequest& request);

  /**
   * The stream is gone. If its span is still open (the response never
   * completed) it is closed with error status. Safe to call more than once.
   */
  void CloseStream(StreamId id, const std::string& reason);

  /** Streams with an open span. */
  size_t OpenSpanCount() const;

  /** Streams opened and not yet closed. */
  size_t ActiveStreamCount() const;

 private:
  ext_proc::ProcessingResponse HandleRequestHeaders(StreamId id, const ext_proc::HttpHeaders& headers);
  ext_proc::ProcessingResponse HandleInbound(StreamId id, const ext_proc::HttpHeaders& headers);
  ext_proc::ProcessingResponse HandleOutbound(const ext_proc::HttpHeaders& headers);
  ext_proc::ProcessingResponse HandleRequestBody(StreamId id, const ext_proc::HttpBody& body);
  ext_proc::ProcessingResponse HandleResponseHeaders(StreamId id, const ext_proc::HttpHeaders& headers);
  ext_proc::ProcessingResponse HandleResponseBody(StreamId id, const ext_proc::HttpBody& body);

  StreamState* FindState(StreamId id);
  std::unique_ptr<StreamState> TakeState(StreamId id);
  void InsertState(StreamId id, std::unique_ptr<StreamState> state);
  void FinishStream(StreamId id);

  ProcessorOptions options_;
  ProcessorComponents components_;

  std::atomic<StreamId> next_id_{1};

  mutable std::mutex mu_;
  std::unordered_set<StreamId> streams_;
  std::unordered_map<StreamId, std::unique_ptr<StreamState>> states_;
};

/**
 * Scoped registration of one stream: opens it on construction and closes
 * it on destruction, so every exit path of a stream worker runs the
 * cleanup exactly once.
 */
class ScopedStream {
 public:
  explicit ScopedStream(StreamProcessor* processor)
      : processor_(processor), id_(processor->OpenStream()) {}

  ~ScopedStream() { processor_->CloseStream(id_, reason_); }

  ScopedStream(const ScopedStream&) = delete;
  ScopedStream& operator=(const ScopedStream&) = delete;

  StreamId id() const { return id_; }

  /** Status description used if the span is still open at close. */
  void set_reason(std::string reason) { reason_ = std::move(reason); }

 private:
  StreamProcessor* processor_;
  StreamId id_;
  std::string reason_ = "stream ended unexpectedly";
};

/** Value of a header (raw_value preferred), or "" if absent. Case-insensitive. */
std::string GetHeader(const ext_proc::HttpHeaders& headers, const std::string& name);

}  // namespace authbridge::server
