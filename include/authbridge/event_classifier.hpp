#pragma once

#include <json/json.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace authbridge {

/** What a streamed A2A event represents. */
enum class EventCategory {
  kUnclassified,
  kLlm,       // an LLM reasoning step
  kTool,      // a tool invocation step
  kArtifact,  // (partial) final answer
  kStatus     // any other status update
};

const char* EventCategoryName(EventCategory category);

struct ClassifiedEvent {
  EventCategory category = EventCategory::kUnclassified;
  std::string text;
};

/**
 * Maps a parsed SSE event to a category.
 *
 * Agents differ in how they mark reasoning steps, so the mapping is a seam:
 * implementations must be stateless and thread-safe.
 */
class EventClassifier {
 public:
  virtual ~EventClassifier() = default;
  virtual ClassifiedEvent Classify(const Json::Value& event) const = 0;
  virtual const char* Name() const = 0;
};

/**
 * Classifier for agents that prefix status text with step markers.
 *
 *   kind "artifact-update"  -> artifact (text of result.artifact.parts[0])
 *   kind "status-update"    -> tool if the status text contains "tools:",
 *                              else llm if it contains "assistant:",
 *                              else status
 *   anything else           -> unclassified
 */
class StepMarkerClassifier : public EventClassifier {
 public:
  ClassifiedEvent Classify(const Json::Value& event) const override;
  const char* Name() const override { return "step-marker"; }
};

/** GenAI attributes recovered from an LLM or tool step's text. */
struct StepDetails {
  std::string span_name;
  std::vector<std::pair<std::string, std::string>> string_attributes;
  std::vector<std::pair<std::string, int64_t>> int_attributes;
};

/**
 * Extract GenAI details from a step whose text embeds a LangGraph state
 * object ({"messages":[...]}). For llm steps the last "ai" message supplies
 * model, token usage, finish reason and requested tool calls; for tool steps
 * the first "tool" message supplies tool name and call id. The span name is
 * always set ("chat [model]" or "execute_tool [name]").
 */
StepDetails ExtractStepDetails(EventCategory category, std::string_view text);

}  // namespace authbridge
