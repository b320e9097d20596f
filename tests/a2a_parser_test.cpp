// A2A wire format tests
// Tests: request envelope, the three response strategies, SSE reassembly

#include <gtest/gtest.h>

#include <authbridge/a2a_parser.hpp>

#include <string>
#include <vector>

namespace authbridge {
namespace {

const char* kJsonRpcResponse =
    R"({"jsonrpc":"2.0","id":"1","result":{"kind":"task","id":"t1","contextId":"c1",)"
    R"("artifacts":[{"parts":[{"kind":"text","text":"It is 65F and sunny."}]}]}})";

// =============================================================================
// Request Parsing
// =============================================================================

TEST(ParseAgentRequestTest, ExtractsInputAndConversation) {
  auto request = ParseAgentRequest(
      R"({"jsonrpc":"2.0","method":"message/stream","params":{"contextId":"c1",)"
      R"("message":{"messageId":"m1","parts":[{"text":"What's the weather?"}]}}})");
  EXPECT_TRUE(request.valid);
  EXPECT_EQ(request.method, "message/stream");
  EXPECT_EQ(request.user_input, "What's the weather?");
  EXPECT_EQ(request.conversation_id, "c1");
}

TEST(ParseAgentRequestTest, ConversationFallsBackToMessage) {
  auto request = ParseAgentRequest(
      R"({"params":{"message":{"contextId":"c2","parts":[{"text":"hi"}]}}})");
  EXPECT_EQ(request.conversation_id, "c2");
}

TEST(ParseAgentRequestTest, RequestLevelConversationWins) {
  auto request = ParseAgentRequest(
      R"({"params":{"contextId":"outer","message":{"contextId":"inner","parts":[]}}})");
  EXPECT_EQ(request.conversation_id, "outer");
}

TEST(ParseAgentRequestTest, SkipsPartsWithoutText) {
  auto request = ParseAgentRequest(
      R"({"params":{"message":{"parts":[{"kind":"file","file":{}},{"text":"second"}]}}})");
  EXPECT_EQ(request.user_input, "second");
}

TEST(ParseAgentRequestTest, MalformedBodyIsInvalid) {
  EXPECT_FALSE(ParseAgentRequest("").valid);
  EXPECT_FALSE(ParseAgentRequest("{\"params\":").valid);
  EXPECT_FALSE(ParseAgentRequest("[1,2]").valid);
  EXPECT_FALSE(ParseAgentRequest("{} trailing").valid);
}

TEST(ParseAgentRequestTest, MissingFieldsAreEmpty) {
  auto request = ParseAgentRequest(R"({"params":{"message":"not an object"}})");
  EXPECT_TRUE(request.valid);
  EXPECT_TRUE(request.user_input.empty());
  EXPECT_TRUE(request.conversation_id.empty());
}

// =============================================================================
// Response Parsing
// =============================================================================

TEST(ParseAgentResponseTest, JsonRpcBody) {
  auto response = ParseAgentResponse(kJsonRpcResponse);
  EXPECT_EQ(response.output, "It is 65F and sunny.");
  EXPECT_EQ(response.source, OutputSource::kJsonRpc);
}

TEST(ParseAgentResponseTest, SseWrappedResponseMatchesPlainBody) {
  std::string sse = std::string("data: ") + kJsonRpcResponse + "\n\n";
  auto plain = ParseAgentResponse(kJsonRpcResponse);
  auto wrapped = ParseAgentResponse(sse);
  EXPECT_EQ(wrapped.output, plain.output);
  EXPECT_EQ(wrapped.source, OutputSource::kSse);
}

TEST(ParseAgentResponseTest, SseLastArtifactWins) {
  std::string body =
      "data: {\"result\":{\"kind\":\"artifact-update\",\"artifact\":{\"parts\":[{\"text\":\"It is\"}]}}}\n\n"
      "data: {\"result\":{\"kind\":\"status-update\",\"status\":{\"state\":\"working\"}}}\n\n"
      "data: {\"result\":{\"kind\":\"artifact-update\",\"artifact\":{\"parts\":[{\"text\":\"It is 65F\"}]}}}\n\n"
      "data: {\"result\":{\"kind\":\"artifact-update\",\"artifact\":{\"parts\":[{\"text\":\"\"}]}}}\n\n";
  auto response = ParseAgentResponse(body);
  EXPECT_EQ(response.output, "It is 65F");
  EXPECT_EQ(response.source, OutputSource::kSse);
}

TEST(ParseAgentResponseTest, SseSkipsUnparseableFrames) {
  std::string body =
      "event: message\n"
      "data: {not json\n\n"
      "data: {\"result\":{\"artifact\":{\"parts\":[{\"text\":\"ok\"}]}}}\r\n\r\n";
  EXPECT_EQ(ParseAgentResponse(body).output, "ok");
}

TEST(ParseAgentResponseTest, TrailingObjectFallback) {
  std::string body = std::string("garbage prefix } { ") + kJsonRpcResponse;
  auto response = ParseAgentResponse(body);
  EXPECT_EQ(response.output, "It is 65F and sunny.");
  EXPECT_EQ(response.source, OutputSource::kTrailingObject);
}

TEST(ParseAgentResponseTest, EmptyArtifactFallsThrough) {
  auto response = ParseAgentResponse(
      R"({"result":{"artifacts":[{"parts":[{"text":""}]}]}})");
  EXPECT_TRUE(response.output.empty());
  EXPECT_EQ(response.source, OutputSource::kNone);
}

TEST(ParseAgentResponseTest, NothingToExtract) {
  EXPECT_EQ(ParseAgentResponse("").source, OutputSource::kNone);
  EXPECT_EQ(ParseAgentResponse("plain text").source, OutputSource::kNone);
  EXPECT_EQ(ParseAgentResponse("{{{{").source, OutputSource::kNone);
  EXPECT_EQ(ParseAgentResponse(R"({"error":{"code":-32600}})").source, OutputSource::kNone);
}

// =============================================================================
// SSE Helpers
// =============================================================================

TEST(SseDataPayloadsTest, ReturnsDataLinesInOrder) {
  auto payloads = SseDataPayloads("id: 1\ndata: a\n\ndata:b\ndata:   \n: comment\ndata: c");
  ASSERT_EQ(payloads.size(), 3u);
  EXPECT_EQ(payloads[0], "a");
  EXPECT_EQ(payloads[1], "b");
  EXPECT_EQ(payloads[2], "c");
}

TEST(SseDataPayloadsTest, AcceptsIndentedDataLines) {
  auto payloads = SseDataPayloads("  data: a\n\tdata: b\r\n   \n  id: 2\n");
  ASSERT_EQ(payloads.size(), 2u);
  EXPECT_EQ(payloads[0], "a");
  EXPECT_EQ(payloads[1], "b");

  SseLineBuffer buffer;
  auto fed = buffer.Feed(" data: {\"x\":1}\n");
  ASSERT_EQ(fed.size(), 1u);
  EXPECT_EQ(fed[0], "{\"x\":1}");
}

TEST(ParseAgentResponseTest, IndentedSseFramesAreParsed) {
  auto response = ParseAgentResponse(
      "  data: {\"result\":{\"kind\":\"artifact-update\",\"artifact\":"
      "{\"parts\":[{\"text\":\"sunny\"}]}}}\n\n");
  EXPECT_EQ(response.output, "sunny");
  EXPECT_EQ(response.source, OutputSource::kSse);
}

TEST(SseLineBufferTest, ReassemblesSplitLines) {
  SseLineBuffer buffer;
  EXPECT_TRUE(buffer.Feed("da").empty());
  EXPECT_TRUE(buffer.Feed("ta: {\"a\"").empty());
  auto out = buffer.Feed(":1}\n\ndata: x\ndata: y");
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0], "{\"a\":1}");
  EXPECT_EQ(out[1], "x");
  EXPECT_GT(buffer.pending_bytes(), 0u);

  auto rest = buffer.Finish();
  ASSERT_EQ(rest.size(), 1u);
  EXPECT_EQ(rest[0], "y");
  EXPECT_EQ(buffer.pending_bytes(), 0u);
}

TEST(SseLineBufferTest, ByteAtATimeMatchesWholeBody) {
  std::string body =
      "data: {\"n\":1}\n\ndata: {\"n\":2}\r\n\r\nevent: end\ndata: {\"n\":3}\n\n";
  SseLineBuffer whole;
  auto expected = whole.Feed(body);

  SseLineBuffer bytes;
  std::vector<std::string> got;
  for (char c : body) {
    for (auto& payload : bytes.Feed(std::string(1, c))) {
      got.push_back(payload);
    }
  }
  EXPECT_EQ(got, expected);
  EXPECT_EQ(got.size(), 3u);
}

TEST(SseLineBufferTest, DropsOversizedLine) {
  SseLineBuffer buffer;
  std::string huge = "data: " + std::string(SseLineBuffer::kMaxLineBytes, 'x');
  EXPECT_TRUE(buffer.Feed(huge).empty());
  EXPECT_EQ(buffer.pending_bytes(), 0u);

  // The rest of the oversized line is skipped; the next line is read.
  auto out = buffer.Feed("yyyy\ndata: next\n");
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], "next");
}

// =============================================================================
// Context Id
// =============================================================================

TEST(ExtractContextIdTest, TaskAndUpdateEvents) {
  Json::Value task;
  ASSERT_TRUE(ParseJson(R"({"result":{"kind":"task","id":"t1","contextId":"c1"}})", &task));
  EXPECT_EQ(ExtractContextId(task), "c1");

  Json::Value update;
  ASSERT_TRUE(ParseJson(
      R"({"result":{"kind":"status-update","taskId":"t2","contextId":"c2"}})", &update));
  EXPECT_EQ(ExtractContextId(update), "c2");
}

TEST(ExtractContextIdTest, NonObjectResult) {
  Json::Value event;
  ASSERT_TRUE(ParseJson(R"({"result":"done"})", &event));
  EXPECT_TRUE(ExtractContextId(event).empty());
}

}  // namespace
}  // namespace authbridge
