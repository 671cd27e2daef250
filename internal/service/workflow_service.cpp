#include "workflow_service.hpp"

#include <algorithm>
#include <chrono>
#include <string_view>

#include "internal/core/orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace weave::service {

using namespace weave::v1;

namespace {

// cap on one GetResult wait; clients re-issue for longer waits
constexpr util::Millis kMaxResultWait{std::chrono::minutes(5)};

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& workflow_id, Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    WEAVE_LOG_ERROR("RPC failed", {weave::observability::StringField("route", route), weave::observability::StringField("error", ex.what()),
                                   weave::observability::StringField("workflow_id", workflow_id)});
    throw;
  }
}

} // namespace

WorkflowService::WorkflowService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StartWorkflowResponse WorkflowService::StartWorkflow(const StartWorkflowRequest& req) {
  return ObserveRpc("WorkflowService.StartWorkflow", req.workflow_id(), [&] {
    core::StartWorkflowOptions options;
    options.workflow_id  = req.workflow_id();
    options.task_queue   = req.task_queue();
    options.reuse_policy = req.reuse_policy();
    if (req.has_execution_timeout()) options.execution_timeout = util::FromProto(req.execution_timeout());

    const auto started = ctx_.orchestrator->StartWorkflow(req.workflow_type(), req.input(), options);

    StartWorkflowResponse resp;
    resp.set_workflow_id(started.workflow_id);
    resp.set_run_id(started.run_id);
    return resp;
  });
}

GetStatusResponse WorkflowService::GetStatus(const GetStatusRequest& req) {
  return ObserveRpc("WorkflowService.GetStatus", req.workflow_id(), [&] {
    const auto run = ctx_.orchestrator->GetStatus(req.workflow_id());

    GetStatusResponse resp;
    resp.set_workflow_id(run.workflow_id);
    resp.set_run_id(run.run_id);
    resp.set_workflow_type(run.workflow_type);
    resp.set_status(run.status);
    *resp.mutable_created_at() = util::ToProto(util::FromUnixMillis(run.created_at_ms));
    *resp.mutable_updated_at() = util::ToProto(util::FromUnixMillis(run.updated_at_ms));
    return resp;
  });
}

GetResultResponse WorkflowService::GetResult(const GetResultRequest& req) {
  return ObserveRpc("WorkflowService.GetResult", req.workflow_id(), [&] {
    const util::Millis wait    = req.has_wait() ? std::min(util::FromProto(req.wait()), kMaxResultWait) : util::Millis(0);
    const auto         outcome = ctx_.orchestrator->GetResult(req.workflow_id(), wait);

    GetResultResponse resp;
    resp.set_workflow_id(outcome.run.workflow_id);
    resp.set_run_id(outcome.run.run_id);
    resp.set_status(outcome.run.status);
    resp.set_still_running(outcome.still_running);
    if (outcome.run.status == WORKFLOW_STATUS_COMPLETED) {
      resp.set_result(outcome.run.result);
    } else if (outcome.failure.has_value()) {
      *resp.mutable_failure() = *outcome.failure;
    }
    return resp;
  });
}

GetHistoryResponse WorkflowService::GetHistory(const GetHistoryRequest& req) {
  return ObserveRpc("WorkflowService.GetHistory", req.workflow_id(), [&] {
    auto history = ctx_.orchestrator->GetHistory(req.workflow_id(), req.from_sequence());

    GetHistoryResponse resp;
    resp.set_run_id(history.run_id);
    for (auto& event : history.events) {
      *resp.add_events() = std::move(event);
    }
    return resp;
  });
}

RequestCancelResponse WorkflowService::RequestCancel(const RequestCancelRequest& req) {
  return ObserveRpc("WorkflowService.RequestCancel", req.workflow_id(), [&] {
    ctx_.orchestrator->RequestCancel(req.workflow_id(), req.reason());
    return RequestCancelResponse{};
  });
}

SignalWorkflowResponse WorkflowService::SignalWorkflow(const SignalWorkflowRequest& req) {
  return ObserveRpc("WorkflowService.SignalWorkflow", req.workflow_id(), [&] {
    ctx_.orchestrator->SignalWorkflow(req.workflow_id(), req.signal_name(), req.payload());
    return SignalWorkflowResponse{};
  });
}

TerminateResponse WorkflowService::Terminate(const TerminateRequest& req) {
  return ObserveRpc("WorkflowService.Terminate", req.workflow_id(), [&] {
    ctx_.orchestrator->Terminate(req.workflow_id(), req.reason());
    return TerminateResponse{};
  });
}

} // namespace weave::service
