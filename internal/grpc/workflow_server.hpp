#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/workflow_service.hpp"
#include "weave/v1/workflow_service.grpc.pb.h"

namespace weave::grpc {

class WorkflowServer final : public weave::v1::WorkflowService::Service {
 public:
  explicit WorkflowServer(std::shared_ptr<weave::service::WorkflowService> svc);

  ::grpc::Status StartWorkflow(::grpc::ServerContext*, const weave::v1::StartWorkflowRequest*, weave::v1::StartWorkflowResponse*) override;
  ::grpc::Status GetStatus(::grpc::ServerContext*, const weave::v1::GetStatusRequest*, weave::v1::GetStatusResponse*) override;
  ::grpc::Status GetResult(::grpc::ServerContext*, const weave::v1::GetResultRequest*, weave::v1::GetResultResponse*) override;
  ::grpc::Status GetHistory(::grpc::ServerContext*, const weave::v1::GetHistoryRequest*, weave::v1::GetHistoryResponse*) override;
  ::grpc::Status RequestCancel(::grpc::ServerContext*, const weave::v1::RequestCancelRequest*, weave::v1::RequestCancelResponse*) override;
  ::grpc::Status SignalWorkflow(::grpc::ServerContext*, const weave::v1::SignalWorkflowRequest*, weave::v1::SignalWorkflowResponse*) override;
  ::grpc::Status Terminate(::grpc::ServerContext*, const weave::v1::TerminateRequest*, weave::v1::TerminateResponse*) override;

 private:
  std::shared_ptr<weave::service::WorkflowService> service_;
};

} // namespace weave::grpc
