#pragma once

#include "service_context.hpp"
#include "weave/v1/workflow_service.pb.h"

namespace weave::service {

/*
  Protobuf-level facade over the orchestrator.

  Throws the weave::util exception taxonomy; the transport maps it to
  status codes.
*/
class WorkflowService {
 public:
  explicit WorkflowService(ServiceContext ctx);

  weave::v1::StartWorkflowResponse  StartWorkflow(const weave::v1::StartWorkflowRequest& req);
  weave::v1::GetStatusResponse      GetStatus(const weave::v1::GetStatusRequest& req);
  weave::v1::GetResultResponse      GetResult(const weave::v1::GetResultRequest& req);
  weave::v1::GetHistoryResponse     GetHistory(const weave::v1::GetHistoryRequest& req);
  weave::v1::RequestCancelResponse  RequestCancel(const weave::v1::RequestCancelRequest& req);
  weave::v1::SignalWorkflowResponse SignalWorkflow(const weave::v1::SignalWorkflowRequest& req);
  weave::v1::TerminateResponse      Terminate(const weave::v1::TerminateRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace weave::service
