#include "client/cpp/weave_client.h"

#include <google/protobuf/util/time_util.h>
#include <grpcpp/client_context.h>

#include "internal/grpc/grpc_error.hpp"

namespace weave::client {

using google::protobuf::util::TimeUtil;
using weave::grpc::ThrowIfError;

namespace {

// GetResult waits server side; leave headroom beyond the requested wait.
constexpr std::chrono::seconds kResultDeadlineSlack{5};

} // namespace

WeaveClient::WeaveClient(std::shared_ptr<::grpc::Channel> channel)
    : workflow_stub_(weave::v1::WorkflowService::NewStub(channel)), admin_stub_(weave::v1::AdminService::NewStub(channel)) {
}

weave::v1::StartWorkflowResponse WeaveClient::StartWorkflow(const weave::v1::StartWorkflowRequest& request) const {
  ::grpc::ClientContext            ctx;
  weave::v1::StartWorkflowResponse resp;
  ThrowIfError(workflow_stub_->StartWorkflow(&ctx, request, &resp), "StartWorkflow");
  return resp;
}

weave::v1::StartWorkflowResponse WeaveClient::StartWorkflow(const std::string& workflow_type, const std::string& input,
                                                            const std::string& workflow_id, const std::string& task_queue) const {
  weave::v1::StartWorkflowRequest req;
  req.set_workflow_type(workflow_type);
  req.set_input(input);
  req.set_workflow_id(workflow_id);
  req.set_task_queue(task_queue);
  return StartWorkflow(req);
}

weave::v1::GetStatusResponse WeaveClient::GetStatus(const std::string& workflow_id) const {
  weave::v1::GetStatusRequest req;
  req.set_workflow_id(workflow_id);

  ::grpc::ClientContext        ctx;
  weave::v1::GetStatusResponse resp;
  ThrowIfError(workflow_stub_->GetStatus(&ctx, req, &resp), "GetStatus");
  return resp;
}

weave::v1::GetResultResponse WeaveClient::GetResult(const std::string& workflow_id, std::chrono::milliseconds wait) const {
  weave::v1::GetResultRequest req;
  req.set_workflow_id(workflow_id);
  *req.mutable_wait() = TimeUtil::MillisecondsToDuration(wait.count());

  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + wait + kResultDeadlineSlack);

  weave::v1::GetResultResponse resp;
  ThrowIfError(workflow_stub_->GetResult(&ctx, req, &resp), "GetResult");
  return resp;
}

weave::v1::GetHistoryResponse WeaveClient::GetHistory(const std::string& workflow_id, uint64_t from_sequence) const {
  weave::v1::GetHistoryRequest req;
  req.set_workflow_id(workflow_id);
  req.set_from_sequence(from_sequence);

  ::grpc::ClientContext         ctx;
  weave::v1::GetHistoryResponse resp;
  ThrowIfError(workflow_stub_->GetHistory(&ctx, req, &resp), "GetHistory");
  return resp;
}

void WeaveClient::RequestCancel(const std::string& workflow_id, const std::string& reason) const {
  weave::v1::RequestCancelRequest req;
  req.set_workflow_id(workflow_id);
  req.set_reason(reason);

  ::grpc::ClientContext            ctx;
  weave::v1::RequestCancelResponse resp;
  ThrowIfError(workflow_stub_->RequestCancel(&ctx, req, &resp), "RequestCancel");
}

void WeaveClient::SignalWorkflow(const std::string& workflow_id, const std::string& signal_name, const std::string& payload) const {
  weave::v1::SignalWorkflowRequest req;
  req.set_workflow_id(workflow_id);
  req.set_signal_name(signal_name);
  req.set_payload(payload);

  ::grpc::ClientContext             ctx;
  weave::v1::SignalWorkflowResponse resp;
  ThrowIfError(workflow_stub_->SignalWorkflow(&ctx, req, &resp), "SignalWorkflow");
}

void WeaveClient::Terminate(const std::string& workflow_id, const std::string& reason) const {
  weave::v1::TerminateRequest req;
  req.set_workflow_id(workflow_id);
  req.set_reason(reason);

  ::grpc::ClientContext        ctx;
  weave::v1::TerminateResponse resp;
  ThrowIfError(workflow_stub_->Terminate(&ctx, req, &resp), "Terminate");
}

weave::v1::StatsResponse WeaveClient::Stats() const {
  ::grpc::ClientContext    ctx;
  weave::v1::StatsResponse resp;
  ThrowIfError(admin_stub_->Stats(&ctx, weave::v1::StatsRequest{}, &resp), "Stats");
  return resp;
}

weave::v1::HealthResponse WeaveClient::Health() const {
  ::grpc::ClientContext     ctx;
  weave::v1::HealthResponse resp;
  ThrowIfError(admin_stub_->Health(&ctx, weave::v1::HealthRequest{}, &resp), "Health");
  return resp;
}

} // namespace weave::client
