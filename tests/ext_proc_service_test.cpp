// gRPC ExternalProcessor service tests
// Tests: in-process streams, cancellation cleanup, half-close cleanup

#include <gtest/gtest.h>

#include <authbridge/server/ext_proc_service.hpp>
#include <authbridge/server/metrics.hpp>
#include <authbridge/test_utils.hpp>

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace authbridge::server {
namespace {

using authbridge::testing::RecordedSpan;
using authbridge::testing::RecordingTracer;

using ClientStream =
    grpc::ClientReaderWriter<ext_proc::ProcessingRequest, ext_proc::ProcessingResponse>;

ext_proc::ProcessingRequest Headers(const std::string& path) {
  ext_proc::ProcessingRequest request;
  auto* headers = request.mutable_request_headers()->mutable_headers();
  auto* h = headers->add_headers();
  h->set_key(":path");
  h->set_raw_value(path);
  return request;
}

ext_proc::ProcessingRequest Body(bool response, const std::string& body, bool end_of_stream) {
  ext_proc::ProcessingRequest request;
  auto* http_body = response ? request.mutable_response_body() : request.mutable_request_body();
  http_body->set_body(body);
  http_body->set_end_of_stream(end_of_stream);
  return request;
}

class ExtProcServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tracer_ = std::make_shared<RecordingTracer>();
    metrics_ = std::make_shared<PrometheusMetrics>();

    ProcessorComponents components;
    components.spans = std::make_shared<SpanManager>(tracer_, SpanManagerOptions{});
    components.metrics = metrics_;
    processor_ = std::make_unique<StreamProcessor>(ProcessorOptions{}, std::move(components));
    service_ = std::make_unique<ExtProcService>(processor_.get());

    grpc::ServerBuilder builder;
    builder.RegisterService(service_.get());
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);
    stub_ = ext_proc::ExternalProcessor::NewStub(server_->InProcessChannel(grpc::ChannelArguments()));
  }

  void TearDown() override {
    if (server_) {
      server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
    }
  }

  // Stream workers release their state after the client sees the status,
  // so poll briefly.
  bool WaitForIdle() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
      if (processor_->ActiveStreamCount() == 0) return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
  }

  static ext_proc::ProcessingResponse RoundTrip(ClientStream* stream,
                                                const ext_proc::ProcessingRequest& request) {
    ext_proc::ProcessingResponse response;
    EXPECT_TRUE(stream->Write(request));
    EXPECT_TRUE(stream->Read(&response));
    return response;
  }

  std::shared_ptr<RecordingTracer> tracer_;
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::unique_ptr<StreamProcessor> processor_;
  std::unique_ptr<ExtProcService> service_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<ext_proc::ExternalProcessor::Stub> stub_;
};

TEST_F(ExtProcServiceTest, CompleteExchangeOverGrpc) {
  grpc::ClientContext context;
  auto stream = stub_->Process(&context);

  auto headers = RoundTrip(stream.get(), Headers("/"));
  ASSERT_TRUE(headers.has_request_headers());
  bool has_traceparent = false;
  for (const auto& option : headers.request_headers().response().header_mutation().set_headers()) {
    if (option.header().key() == "traceparent") has_traceparent = true;
  }
  EXPECT_TRUE(has_traceparent);

  EXPECT_TRUE(RoundTrip(stream.get(),
                        Body(false,
                             R"({"params":{"message":{"parts":[{"text":"hi"}]}}})", true))
                  .has_request_body());
  EXPECT_TRUE(RoundTrip(stream.get(),
                        Body(true,
                             "data: {\"result\":{\"kind\":\"artifact-update\",\"artifact\":"
                             "{\"parts\":[{\"text\":\"hello\"}]}}}\n\n",
                             true))
                  .has_response_body());

  stream->WritesDone();
  grpc::Status status = stream->Finish();
  EXPECT_TRUE(status.ok()) << status.error_message();
  ASSERT_TRUE(WaitForIdle());

  auto roots = tracer_->ChildrenOf(-1);
  ASSERT_EQ(roots.size(), 1u);
  EXPECT_EQ(roots[0].String("input.value"), "hi");
  EXPECT_EQ(roots[0].String("output.value"), "hello");
  EXPECT_EQ(roots[0].status, SpanStatus::kOk);
  EXPECT_EQ(roots[0].end_count, 1);
  EXPECT_EQ(processor_->OpenSpanCount(), 0u);
}

TEST_F(ExtProcServiceTest, ClientCancelClosesSpanWithError) {
  grpc::ClientContext context;
  auto stream = stub_->Process(&context);
  ASSERT_TRUE(RoundTrip(stream.get(), Headers("/")).has_request_headers());
  EXPECT_EQ(processor_->OpenSpanCount(), 1u);

  context.TryCancel();
  grpc::Status status = stream->Finish();
  EXPECT_EQ(status.error_code(), grpc::StatusCode::CANCELLED);
  ASSERT_TRUE(WaitForIdle());

  auto roots = tracer_->ChildrenOf(-1);
  ASSERT_EQ(roots.size(), 1u);
  EXPECT_EQ(roots[0].status, SpanStatus::kError);
  EXPECT_EQ(roots[0].end_count, 1);
  EXPECT_EQ(processor_->OpenSpanCount(), 0u);
}

TEST_F(ExtProcServiceTest, HalfCloseBeforeResponseEndClosesSpan) {
  grpc::ClientContext context;
  auto stream = stub_->Process(&context);
  ASSERT_TRUE(RoundTrip(stream.get(), Headers("/")).has_request_headers());

  stream->WritesDone();
  EXPECT_TRUE(stream->Finish().ok());
  ASSERT_TRUE(WaitForIdle());

  auto roots = tracer_->ChildrenOf(-1);
  ASSERT_EQ(roots.size(), 1u);
  EXPECT_EQ(roots[0].status, SpanStatus::kError);
  EXPECT_EQ(roots[0].description, "stream closed before end of response");
}

TEST_F(ExtProcServiceTest, ManySequentialStreams) {
  for (int i = 0; i < 10; ++i) {
    grpc::ClientContext context;
    auto stream = stub_->Process(&context);
    RoundTrip(stream.get(), Headers("/"));
    RoundTrip(stream.get(), Body(true, "{}", true));
    stream->WritesDone();
    EXPECT_TRUE(stream->Finish().ok());
  }
  ASSERT_TRUE(WaitForIdle());
  EXPECT_EQ(tracer_->ChildrenOf(-1).size(), 10u);
  EXPECT_EQ(metrics_->CounterValue("authbridge_ext_proc_streams_total"), 10u);
}

}  // namespace
}  // namespace authbridge::server
