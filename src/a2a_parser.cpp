#include <authbridge/a2a_parser.hpp>
#include <authbridge/internal.hpp>

#include <trantor/utils/Logger.h>

#include <exception>
#include <memory>

namespace authbridge {

namespace {

constexpr std::string_view kDataPrefix = "data:";

void EmitDataLine(std::string_view line, std::vector<std::string>* out) {
  size_t first = line.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) return;
  line.remove_prefix(first);
  if (!internal::StartsWith(line, kDataPrefix)) return;
  std::string payload = internal::Trim(line.substr(kDataPrefix.size()));
  if (!payload.empty()) {
    out->push_back(std::move(payload));
  }
}

// result.artifacts[0].parts[0].text of a JSON-RPC response.
std::string CompletedArtifactText(const Json::Value& root) {
  const Json::Value& artifact = JsonIndex(JsonMember(JsonMember(root, "result"), "artifacts"), 0);
  return PartText(artifact);
}

// result.artifact.parts[0].text of an artifact-update event.
std::string ArtifactUpdateText(const Json::Value& root) {
  return PartText(JsonMember(JsonMember(root, "result"), "artifact"));
}

std::string FromJsonRpcBody(std::string_view body) {
  Json::Value root;
  if (!ParseJson(body, &root)) return "";
  return CompletedArtifactText(root);
}

std::string FromSseEvents(std::string_view body) {
  std::string last;
  for (const auto& payload : SseDataPayloads(body)) {
    Json::Value event;
    if (!ParseJson(payload, &event)) continue;
    std::string text = CompletedArtifactText(event);
    if (text.empty()) {
      text = ArtifactUpdateText(event);
    }
    if (!text.empty()) {
      last = std::move(text);
    }
  }
  return last;
}

// Last balanced {...} in the body. Braces inside strings are not special.
std::string FromTrailingObject(std::string_view body) {
  size_t end = body.rfind('}');
  if (end == std::string_view::npos) return "";

  int depth = 0;
  for (size_t i = end + 1; i-- > 0;) {
    if (body[i] == '}') {
      ++depth;
    } else if (body[i] == '{') {
      if (--depth == 0) {
        return FromJsonRpcBody(body.substr(i, end - i + 1));
      }
    }
  }
  return "";
}

}  // namespace

bool ParseJson(std::string_view text, Json::Value* out) {
  Json::CharReaderBuilder builder;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errs;
  try {
    return reader->parse(text.data(), text.data() + text.size(), out, &errs);
  } catch (const std::exception& e) {
    LOG_DEBUG << "JSON parse aborted: " << e.what();
    return false;
  }
}

const Json::Value& JsonMember(const Json::Value& value, const char* key) {
  if (!value.isObject() || !value.isMember(key)) return Json::Value::nullSingleton();
  return value[key];
}

const Json::Value& JsonIndex(const Json::Value& value, Json::ArrayIndex index) {
  if (!value.isArray() || index >= value.size()) return Json::Value::nullSingleton();
  return value[index];
}

std::string JsonString(const Json::Value& value, const char* key) {
  const Json::Value& member = JsonMember(value, key);
  return member.isString() ? member.asString() : std::string();
}

std::string PartText(const Json::Value& holder, bool first_text_part) {
  const Json::Value& parts = JsonMember(holder, "parts");
  if (!first_text_part) {
    return JsonString(JsonIndex(parts, 0), "text");
  }
  if (!parts.isArray()) return "";
  for (const auto& part : parts) {
    if (JsonMember(part, "text").isString()) {
      return part["text"].asString();
    }
  }
  return "";
}

ParsedAgentRequest ParseAgentRequest(std::string_view body) {
  ParsedAgentRequest request;
  Json::Value root;
  if (!ParseJson(body, &root) || !root.isObject()) {
    return request;
  }
  request.valid = true;
  request.method = JsonString(root, "method");

  const Json::Value& params = JsonMember(root, "params");
  const Json::Value& message = JsonMember(params, "message");
  request.user_input = PartText(message, true);

  request.conversation_id = JsonString(params, "contextId");
  if (request.conversation_id.empty()) {
    request.conversation_id = JsonString(message, "contextId");
  }
  return request;
}

ParsedAgentResponse ParseAgentResponse(std::string_view body) {
  ParsedAgentResponse response;
  if (body.empty()) return response;

  if (auto text = FromJsonRpcBody(body); !text.empty()) {
    response.output = std::move(text);
    response.source = OutputSource::kJsonRpc;
  } else if (auto sse = FromSseEvents(body); !sse.empty()) {
    response.output = std::move(sse);
    response.source = OutputSource::kSse;
  } else if (auto trailing = FromTrailingObject(body); !trailing.empty()) {
    response.output = std::move(trailing);
    response.source = OutputSource::kTrailingObject;
  }
  return response;
}

std::vector<std::string> SseDataPayloads(std::string_view text) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= text.size()) {
    size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      EmitDataLine(text.substr(start), &out);
      break;
    }
    EmitDataLine(text.substr(start, nl - start), &out);
    start = nl + 1;
  }
  return out;
}

std::string ExtractContextId(const Json::Value& event) {
  return JsonString(JsonMember(event, "result"), "contextId");
}

// --- SseLineBuffer ---

std::vector<std::string> SseLineBuffer::Feed(std::string_view chunk) {
  std::vector<std::string> out;
  size_t start = 0;
  size_t nl;
  while ((nl = chunk.find('\n', start)) != std::string_view::npos) {
    std::string_view piece = chunk.substr(start, nl - start);
    if (discarding_) {
      discarding_ = false;
    } else if (pending_.empty()) {
      EmitDataLine(piece, &out);
    } else {
      pending_.append(piece);
      EmitDataLine(pending_, &out);
    }
    pending_.clear();
    start = nl + 1;
  }

  std::string_view rest = chunk.substr(start);
  if (!discarding_ && !rest.empty()) {
    if (pending_.size() + rest.size() > kMaxLineBytes) {
      LOG_WARN << "SSE line exceeds " << kMaxLineBytes << " bytes; dropping it";
      pending_.clear();
      discarding_ = true;
    } else {
      pending_.append(rest);
    }
  }
  return out;
}

std::vector<std::string> SseLineBuffer::Finish() {
  std::vector<std::string> out;
  if (!discarding_ && !pending_.empty()) {
    EmitDataLine(pending_, &out);
  }
  pending_.clear();
  discarding_ = false;
  return out;
}

}  // namespace authbridge
