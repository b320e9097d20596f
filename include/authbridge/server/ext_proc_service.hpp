#pragma once

#include <authbridge/server/stream_processor.hpp>

#include <envoy/service/ext_proc/v3/external_processor.grpc.pb.h>
#include <grpcpp/grpcpp.h>

namespace authbridge::server {

/**
 * gRPC ExternalProcessor service.
 *
 * Each Process() call is one proxied request: messages are read in order,
 * answered one by one through the StreamProcessor, and the stream's state
 * is released on every exit path (clean end, cancel, write failure).
 */
class ExtProcService final : public ext_proc::ExternalProcessor::Service {
 public:
  explicit ExtProcService(StreamProcessor* processor) : processor_(processor) {}

  grpc::Status Process(
      grpc::ServerContext* context,
      grpc::ServerReaderWriter<ext_proc::ProcessingResponse, ext_proc::ProcessingRequest>* stream)
      override;

 private:
  StreamProcessor* processor_;
};

}  // namespace authbridge::server
