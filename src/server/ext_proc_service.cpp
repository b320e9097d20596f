#include <authbridge/server/ext_proc_service.hpp>

#include <trantor/utils/Logger.h>

namespace authbridge::server {

grpc::Status ExtProcService::Process(
    grpc::ServerContext* context,
    grpc::ServerReaderWriter<ext_proc::ProcessingResponse, ext_proc::ProcessingRequest>* stream) {
  ScopedStream scoped(processor_);

  ext_proc::ProcessingRequest request;
  while (stream->Read(&request)) {
    ext_proc::ProcessingResponse response = processor_->Process(scoped.id(), request);
    if (!stream->Write(response)) {
      LOG_WARN << "[ext_proc] Stream " << scoped.id() << ": write failed";
      scoped.set_reason("failed to write ext_proc response");
      return grpc::Status(grpc::StatusCode::UNKNOWN, "failed to write response");
    }
  }

  if (context->IsCancelled()) {
    LOG_DEBUG << "[ext_proc] Stream " << scoped.id() << " cancelled by peer";
    scoped.set_reason("stream cancelled");
    return grpc::Status::CANCELLED;
  }

  scoped.set_reason("stream closed before end of response");
  return grpc::Status::OK;
}

}  // namespace authbridge::server
