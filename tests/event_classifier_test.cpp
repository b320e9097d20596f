// Stream event classification tests

#include <gtest/gtest.h>

#include <authbridge/a2a_parser.hpp>
#include <authbridge/event_classifier.hpp>

#include <memory>
#include <string>

namespace authbridge {
namespace {

Json::Value Parse(const std::string& text) {
  Json::Value value;
  EXPECT_TRUE(ParseJson(text, &value)) << text;
  return value;
}

Json::Value StatusUpdate(const std::string& text) {
  Json::Value event;
  event["result"]["kind"] = "status-update";
  event["result"]["status"]["message"]["parts"][0]["text"] = text;
  return event;
}

std::string StringAttr(const StepDetails& details, const std::string& key) {
  for (const auto& [k, v] : details.string_attributes) {
    if (k == key) return v;
  }
  return "";
}

int64_t IntAttr(const StepDetails& details, const std::string& key) {
  for (const auto& [k, v] : details.int_attributes) {
    if (k == key) return v;
  }
  return -1;
}

// =============================================================================
// StepMarkerClassifier
// =============================================================================

TEST(StepMarkerClassifierTest, ArtifactUpdate) {
  StepMarkerClassifier classifier;
  auto event = classifier.Classify(Parse(
      R"({"result":{"kind":"artifact-update","artifact":{"parts":[{"text":"It is 65F and sunny."}]}}})"));
  EXPECT_EQ(event.category, EventCategory::kArtifact);
  EXPECT_EQ(event.text, "It is 65F and sunny.");
}

TEST(StepMarkerClassifierTest, AssistantMarkerIsLlm) {
  StepMarkerClassifier classifier;
  auto event = classifier.Classify(StatusUpdate("assistant: calling tool"));
  EXPECT_EQ(event.category, EventCategory::kLlm);
  EXPECT_EQ(event.text, "assistant: calling tool");
}

TEST(StepMarkerClassifierTest, ToolsMarkerIsTool) {
  StepMarkerClassifier classifier;
  EXPECT_EQ(classifier.Classify(StatusUpdate("tools: get_weather")).category,
            EventCategory::kTool);
}

TEST(StepMarkerClassifierTest, ToolsWinsOverAssistant) {
  StepMarkerClassifier classifier;
  EXPECT_EQ(classifier.Classify(StatusUpdate("assistant: done; tools: get_weather")).category,
            EventCategory::kTool);
}

TEST(StepMarkerClassifierTest, PlainStatusUpdate) {
  StepMarkerClassifier classifier;
  EXPECT_EQ(classifier.Classify(StatusUpdate("working")).category, EventCategory::kStatus);

  auto no_message = classifier.Classify(
      Parse(R"({"result":{"kind":"status-update","status":{"state":"completed"},"final":true}})"));
  EXPECT_EQ(no_message.category, EventCategory::kStatus);
  EXPECT_TRUE(no_message.text.empty());
}

TEST(StepMarkerClassifierTest, OtherEventsAreUnclassified) {
  StepMarkerClassifier classifier;
  EXPECT_EQ(classifier.Classify(Parse(R"({"result":{"kind":"task","id":"t1"}})")).category,
            EventCategory::kUnclassified);
  EXPECT_EQ(classifier.Classify(Parse(R"({"result":"x"})")).category,
            EventCategory::kUnclassified);
  EXPECT_EQ(classifier.Classify(Parse("[]")).category, EventCategory::kUnclassified);
  EXPECT_STREQ(classifier.Name(), "step-marker");
}

TEST(EventCategoryNameTest, Names) {
  EXPECT_STREQ(EventCategoryName(EventCategory::kLlm), "llm");
  EXPECT_STREQ(EventCategoryName(EventCategory::kTool), "tool");
  EXPECT_STREQ(EventCategoryName(EventCategory::kArtifact), "artifact");
  EXPECT_STREQ(EventCategoryName(EventCategory::kStatus), "status");
  EXPECT_STREQ(EventCategoryName(EventCategory::kUnclassified), "unclassified");
}

// =============================================================================
// Step Details
// =============================================================================

TEST(ExtractStepDetailsTest, LlmStepUsesLastAiMessage) {
  std::string text =
      R"(assistant: {"messages":[)"
      R"({"type":"human","content":"weather?"},)"
      R"({"type":"ai","response_metadata":{"model_name":"old"}},)"
      R"({"type":"ai","tool_calls":[{"name":"get_weather"},{"function":{"name":"get_time"}}],)"
      R"("response_metadata":{"model_name":"llama3.2:3b-instruct-fp16","finish_reason":"tool_calls",)"
      R"("token_usage":{"prompt_tokens":120,"completion_tokens":30,"total_tokens":150}}}]})";
  auto details = ExtractStepDetails(EventCategory::kLlm, text);
  EXPECT_EQ(details.span_name, "chat llama3.2:3b-instruct-fp16");
  EXPECT_EQ(StringAttr(details, "gen_ai.request.model"), "llama3.2:3b-instruct-fp16");
  EXPECT_EQ(StringAttr(details, "gen_ai.response.model"), "llama3.2:3b-instruct-fp16");
  EXPECT_EQ(StringAttr(details, "gen_ai.response.finish_reasons"), "tool_calls");
  EXPECT_EQ(StringAttr(details, "gen_ai.tool.calls"), "get_weather,get_time");
  EXPECT_EQ(IntAttr(details, "gen_ai.usage.input_tokens"), 120);
  EXPECT_EQ(IntAttr(details, "gen_ai.usage.output_tokens"), 30);
  EXPECT_EQ(IntAttr(details, "gen_ai.usage.total_tokens"), 150);
}

TEST(ExtractStepDetailsTest, InputOutputTokenNames) {
  std::string text =
      R"(assistant: {"messages":[{"type":"ai","response_metadata":)"
      R"({"token_usage":{"input_tokens":7,"output_tokens":3}}}]})";
  auto details = ExtractStepDetails(EventCategory::kLlm, text);
  EXPECT_EQ(details.span_name, "chat");
  EXPECT_EQ(IntAttr(details, "gen_ai.usage.input_tokens"), 7);
  EXPECT_EQ(IntAttr(details, "gen_ai.usage.output_tokens"), 3);
  EXPECT_EQ(IntAttr(details, "gen_ai.usage.total_tokens"), -1);
}

TEST(ExtractStepDetailsTest, ToolStepUsesFirstToolMessage) {
  std::string text =
      R"(tools: {"messages":[{"type":"tool","name":"get_weather","tool_call_id":"call_1"},)"
      R"({"type":"tool","name":"other"}]})";
  auto details = ExtractStepDetails(EventCategory::kTool, text);
  EXPECT_EQ(details.span_name, "execute_tool get_weather");
  EXPECT_EQ(StringAttr(details, "gen_ai.tool.name"), "get_weather");
  EXPECT_EQ(StringAttr(details, "gen_ai.tool.call.id"), "call_1");
}

TEST(ExtractStepDetailsTest, PlainTextGetsDefaultNames) {
  auto llm = ExtractStepDetails(EventCategory::kLlm, "assistant: calling tool");
  EXPECT_EQ(llm.span_name, "chat");
  EXPECT_TRUE(llm.string_attributes.empty());

  auto tool = ExtractStepDetails(EventCategory::kTool, "tools: get_weather {broken");
  EXPECT_EQ(tool.span_name, "execute_tool");
  EXPECT_TRUE(tool.string_attributes.empty());
  EXPECT_TRUE(tool.int_attributes.empty());
}

// =============================================================================
// Custom Classifiers
// =============================================================================

// Treats every event with a "step" member as a tool step.
class StepFieldClassifier : public EventClassifier {
 public:
  ClassifiedEvent Classify(const Json::Value& event) const override {
    ClassifiedEvent out;
    if (event.isObject() && event.isMember("step")) {
      out.category = EventCategory::kTool;
      out.text = event["step"].asString();
    }
    return out;
  }
  const char* Name() const override { return "step-field"; }
};

TEST(EventClassifierTest, CustomStrategyIsPluggable) {
  std::unique_ptr<EventClassifier> classifier = std::make_unique<StepFieldClassifier>();
  auto event = classifier->Classify(Parse(R"({"step":"lookup"})"));
  EXPECT_EQ(event.category, EventCategory::kTool);
  EXPECT_EQ(event.text, "lookup");
}

}  // namespace
}  // namespace authbridge
