#pragma once

#include <json/json.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace authbridge {

/**
 * Fields of an A2A JSON-RPC request (message/send, message/stream).
 */
struct ParsedAgentRequest {
  bool valid = false;  // body was a JSON object
  std::string method;
  std::string user_input;       // first text part of params.message.parts
  std::string conversation_id;  // params.contextId, else params.message.contextId
};

/** Which extraction strategy produced a response's output. */
enum class OutputSource {
  kNone,
  kJsonRpc,
  kSse,
  kTrailingObject
};

/**
 * The final answer text of an A2A response body.
 */
struct ParsedAgentResponse {
  std::string output;
  OutputSource source = OutputSource::kNone;
};

/**
 * Parse JSON text into `out`. Trailing non-whitespace is an error.
 * Never throws.
 */
bool ParseJson(std::string_view text, Json::Value* out);

/** `value[key]`, or a null value when `value` is not an object. */
const Json::Value& JsonMember(const Json::Value& value, const char* key);

/** `value[index]`, or a null value when out of range or not an array. */
const Json::Value& JsonIndex(const Json::Value& value, Json::ArrayIndex index);

/** `value[key]` as a string, or "" when absent or not a string. */
std::string JsonString(const Json::Value& value, const char* key);

/**
 * Text of `holder.parts[0].text` (or the first part carrying text when
 * `first_text_part` is set). Empty when absent.
 */
std::string PartText(const Json::Value& holder, bool first_text_part = false);

ParsedAgentRequest ParseAgentRequest(std::string_view body);

/**
 * Extract the final answer from a complete response body. Tries, in order:
 *   1. the body as a JSON-RPC response: result.artifacts[0].parts[0].text
 *   2. SSE "data:" lines: completed artifacts or artifact-update events,
 *      last non-empty text wins
 *   3. the last balanced {...} object in the body, as in (1)
 */
ParsedAgentResponse ParseAgentResponse(std::string_view body);

/** Payloads of the "data:" lines in `text`, in order. */
std::vector<std::string> SseDataPayloads(std::string_view text);

/** result.contextId of a streamed A2A event, or "". */
std::string ExtractContextId(const Json::Value& event);

/**
 * Reassembles SSE lines across arbitrarily split chunks.
 *
 * Feed() returns the payloads of every "data:" line completed by the chunk;
 * a partial trailing line is held until a later chunk (or Finish()) ends it.
 */
class SseLineBuffer {
 public:
  // A single line longer than this is dropped.
  static constexpr size_t kMaxLineBytes = 4 * 1024 * 1024;

  std::vector<std::string> Feed(std::string_view chunk);

  /** Flush a pending unterminated line. */
  std::vector<std::string> Finish();

  size_t pending_bytes() const { return pending_.size(); }

 private:
  std::string pending_;
  bool discarding_ = false;
};

}  // namespace authbridge
