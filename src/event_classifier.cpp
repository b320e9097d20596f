#include <authbridge/event_classifier.hpp>
#include <authbridge/a2a_parser.hpp>
#include <authbridge/internal.hpp>

#include <trantor/utils/Logger.h>

namespace authbridge {

namespace {

constexpr std::string_view kToolMarker = "tools:";
constexpr std::string_view kAssistantMarker = "assistant:";

bool ReadCount(const Json::Value& usage, const char* key, int64_t* out) {
  const Json::Value& v = JsonMember(usage, key);
  if (!v.isNumeric()) return false;
  *out = static_cast<int64_t>(v.asDouble());
  return true;
}

void ExtractLlmDetails(const Json::Value& messages, StepDetails* details) {
  for (Json::ArrayIndex i = messages.size(); i-- > 0;) {
    const Json::Value& msg = messages[i];
    if (JsonString(msg, "type") != "ai") continue;

    const Json::Value& metadata = JsonMember(msg, "response_metadata");
    const Json::Value& usage = JsonMember(metadata, "token_usage");
    int64_t count = 0;
    if (ReadCount(usage, "input_tokens", &count) || ReadCount(usage, "prompt_tokens", &count)) {
      details->int_attributes.emplace_back("gen_ai.usage.input_tokens", count);
    }
    if (ReadCount(usage, "output_tokens", &count) ||
        ReadCount(usage, "completion_tokens", &count)) {
      details->int_attributes.emplace_back("gen_ai.usage.output_tokens", count);
    }
    if (ReadCount(usage, "total_tokens", &count)) {
      details->int_attributes.emplace_back("gen_ai.usage.total_tokens", count);
    }

    std::string model = JsonString(metadata, "model_name");
    if (!model.empty()) {
      details->string_attributes.emplace_back("gen_ai.response.model", model);
      details->string_attributes.emplace_back("gen_ai.request.model", model);
      details->span_name = "chat " + model;
    }
    std::string finish_reason = JsonString(metadata, "finish_reason");
    if (!finish_reason.empty()) {
      details->string_attributes.emplace_back("gen_ai.response.finish_reasons", finish_reason);
    }

    std::string tool_names;
    const Json::Value& calls = JsonMember(msg, "tool_calls");
    if (calls.isArray()) {
      for (const auto& call : calls) {
        std::string name = JsonString(call, "name");
        if (name.empty()) {
          name = JsonString(JsonMember(call, "function"), "name");
        }
        if (name.empty()) continue;
        if (!tool_names.empty()) tool_names += ",";
        tool_names += name;
      }
    }
    if (!tool_names.empty()) {
      details->string_attributes.emplace_back("gen_ai.tool.calls", tool_names);
    }
    return;
  }
}

void ExtractToolDetails(const Json::Value& messages, StepDetails* details) {
  for (const auto& msg : messages) {
    if (JsonString(msg, "type") != "tool") continue;

    std::string name = JsonString(msg, "name");
    if (!name.empty()) {
      details->span_name = "execute_tool " + name;
      details->string_attributes.emplace_back("gen_ai.tool.name", name);
    }
    std::string call_id = JsonString(msg, "tool_call_id");
    if (!call_id.empty()) {
      details->string_attributes.emplace_back("gen_ai.tool.call.id", call_id);
    }
    return;
  }
}

}  // namespace

const char* EventCategoryName(EventCategory category) {
  switch (category) {
    case EventCategory::kLlm: return "llm";
    case EventCategory::kTool: return "tool";
    case EventCategory::kArtifact: return "artifact";
    case EventCategory::kStatus: return "status";
    case EventCategory::kUnclassified: return "unclassified";
  }
  return "unclassified";
}

// --- StepMarkerClassifier ---

ClassifiedEvent StepMarkerClassifier::Classify(const Json::Value& event) const {
  ClassifiedEvent out;
  const Json::Value& result = JsonMember(event, "result");
  std::string kind = JsonString(result, "kind");

  if (kind == "artifact-update") {
    out.category = EventCategory::kArtifact;
    out.text = PartText(JsonMember(result, "artifact"));
  } else if (kind == "status-update") {
    out.text = PartText(JsonMember(JsonMember(result, "status"), "message"));
    // Tool steps also mention the assistant, so tools win.
    if (out.text.find(kToolMarker) != std::string::npos) {
      out.category = EventCategory::kTool;
    } else if (out.text.find(kAssistantMarker) != std::string::npos) {
      out.category = EventCategory::kLlm;
    } else {
      out.category = EventCategory::kStatus;
    }
  }
  return out;
}

StepDetails ExtractStepDetails(EventCategory category, std::string_view text) {
  StepDetails details;
  if (category == EventCategory::kLlm || category == EventCategory::kTool) {
    size_t json_start = text.find('{');
    Json::Value state;
    if (json_start != std::string_view::npos &&
        ParseJson(internal::Trim(text.substr(json_start)), &state)) {
      const Json::Value& messages = JsonMember(state, "messages");
      if (messages.isArray() && !messages.empty()) {
        if (category == EventCategory::kLlm) {
          ExtractLlmDetails(messages, &details);
        } else {
          ExtractToolDetails(messages, &details);
        }
      }
    } else if (json_start != std::string_view::npos) {
      LOG_DEBUG << "[OTEL] Step text carries no parseable state object";
    }
  }

  if (details.span_name.empty()) {
    details.span_name = category == EventCategory::kTool ? "execute_tool" : "chat";
  }
  return details;
}

}  // namespace authbridge
