#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/workflow_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/workflow_service.hpp"
#include "internal/util/errors.hpp"
#include "test_engine.hpp"

namespace {

using weave::testing::TestEngine;

struct Servers {
  TestEngine                  engine;
  weave::grpc::WorkflowServer workflow;
  weave::grpc::AdminServer    admin;

  Servers()
      : workflow(std::make_shared<weave::service::WorkflowService>(weave::service::ServiceContext{engine.orchestrator})),
        admin(std::make_shared<weave::service::AdminService>(weave::service::ServiceContext{engine.orchestrator, "memory"})) {
  }
};

::grpc::Status Start(Servers& s, const std::string& type, const std::string& workflow_id, weave::v1::StartWorkflowResponse* resp) {
  weave::v1::StartWorkflowRequest req;
  req.set_workflow_type(type);
  req.set_workflow_id(workflow_id);
  req.set_input(R"({"value":"x"})");
  ::grpc::ServerContext ctx;
  return s.workflow.StartWorkflow(&ctx, &req, resp);
}

void TestGetStatusOfMissingWorkflowReturnsNotFound() {
  Servers s;

  weave::v1::GetStatusRequest req;
  req.set_workflow_id("missing-workflow");
  weave::v1::GetStatusResponse resp;
  ::grpc::ServerContext        ctx;

  const auto status = s.workflow.GetStatus(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestStartAndStatusRoundTrip() {
  Servers s;

  weave::v1::StartWorkflowResponse started;
  assert(Start(s, "Greeting", "wf-ok", &started).ok());
  assert(started.workflow_id() == "wf-ok");
  assert(!started.run_id().empty());

  weave::v1::GetStatusRequest req;
  req.set_workflow_id("wf-ok");
  weave::v1::GetStatusResponse resp;
  ::grpc::ServerContext        ctx;
  assert(s.workflow.GetStatus(&ctx, &req, &resp).ok());
  assert(resp.run_id() == started.run_id());
  assert(resp.workflow_type() == "Greeting");
  assert(resp.status() == weave::v1::WORKFLOW_STATUS_RUNNING);
}

void TestDuplicateStartReturnsAlreadyExists() {
  Servers s;

  weave::v1::StartWorkflowResponse first;
  assert(Start(s, "Greeting", "wf-dup", &first).ok());

  weave::v1::StartWorkflowResponse second;
  const auto                       status = Start(s, "Greeting", "wf-dup", &second);
  assert(status.error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
}

void TestEmptyWorkflowTypeReturnsInvalidArgument() {
  Servers s;

  weave::v1::StartWorkflowResponse resp;
  const auto                       status = Start(s, "", "wf-empty-type", &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestCancelClosedWorkflowReturnsFailedPrecondition() {
  Servers s;

  weave::v1::StartWorkflowResponse started;
  assert(Start(s, "Greeting", "wf-closed", &started).ok());

  {
    weave::v1::TerminateRequest req;
    req.set_workflow_id("wf-closed");
    req.set_reason("operator");
    weave::v1::TerminateResponse resp;
    ::grpc::ServerContext        ctx;
    assert(s.workflow.Terminate(&ctx, &req, &resp).ok());
  }

  weave::v1::RequestCancelRequest req;
  req.set_workflow_id("wf-closed");
  weave::v1::RequestCancelResponse resp;
  ::grpc::ServerContext            ctx;

  const auto status = s.workflow.RequestCancel(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestGetResultReportsTerminatedFailure() {
  Servers s;

  weave::v1::StartWorkflowResponse started;
  assert(Start(s, "Greeting", "wf-result", &started).ok());

  {
    weave::v1::GetResultRequest req;
    req.set_workflow_id("wf-result");
    weave::v1::GetResultResponse resp;
    ::grpc::ServerContext        ctx;
    assert(s.workflow.GetResult(&ctx, &req, &resp).ok());
    assert(resp.still_running());
  }

  {
    weave::v1::TerminateRequest req;
    req.set_workflow_id("wf-result");
    weave::v1::TerminateResponse resp;
    ::grpc::ServerContext        ctx;
    assert(s.workflow.Terminate(&ctx, &req, &resp).ok());
  }

  weave::v1::GetResultRequest req;
  req.set_workflow_id("wf-result");
  weave::v1::GetResultResponse resp;
  ::grpc::ServerContext        ctx;
  assert(s.workflow.GetResult(&ctx, &req, &resp).ok());
  assert(!resp.still_running());
  assert(resp.status() == weave::v1::WORKFLOW_STATUS_TERMINATED);
  assert(resp.has_failure());
  assert(resp.failure().category() == "Terminated");
}

void TestHistoryOfMissingWorkflowReturnsNotFound() {
  Servers s;

  weave::v1::GetHistoryRequest req;
  req.set_workflow_id("nope");
  weave::v1::GetHistoryResponse resp;
  ::grpc::ServerContext         ctx;
  assert(s.workflow.GetHistory(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestStatsReturnsOk() {
  Servers s;

  weave::v1::StartWorkflowResponse started;
  assert(Start(s, "Greeting", "wf-stats", &started).ok());

  weave::v1::StatsRequest  req;
  weave::v1::StatsResponse resp;
  ::grpc::ServerContext    ctx;
  assert(s.admin.Stats(&ctx, &req, &resp).ok());
  assert(resp.runs_running() == 1);
  assert(resp.queues_size() >= 1);
}

void TestSignalRoutesToRunAndRejectsClosed() {
  Servers s;

  weave::v1::StartWorkflowResponse started;
  assert(Start(s, "Greeting", "wf-signal", &started).ok());

  weave::v1::SignalWorkflowRequest req;
  req.set_workflow_id("wf-signal");
  req.set_signal_name("approve");
  req.set_payload("yes");
  {
    weave::v1::SignalWorkflowResponse resp;
    ::grpc::ServerContext             ctx;
    assert(s.workflow.SignalWorkflow(&ctx, &req, &resp).ok());
  }
  assert(s.engine.CountEvents("wf-signal", weave::v1::EVENT_TYPE_WORKFLOW_SIGNALED) == 1);

  {
    weave::v1::SignalWorkflowRequest unnamed = req;
    unnamed.clear_signal_name();
    weave::v1::SignalWorkflowResponse resp;
    ::grpc::ServerContext             ctx;
    assert(s.workflow.SignalWorkflow(&ctx, &unnamed, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }

  {
    weave::v1::TerminateRequest terminate;
    terminate.set_workflow_id("wf-signal");
    weave::v1::TerminateResponse resp;
    ::grpc::ServerContext        ctx;
    assert(s.workflow.Terminate(&ctx, &terminate, &resp).ok());
  }

  weave::v1::SignalWorkflowResponse resp;
  ::grpc::ServerContext             ctx;
  assert(s.workflow.SignalWorkflow(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestHealthReportsStore() {
  Servers s;

  weave::v1::HealthRequest  req;
  weave::v1::HealthResponse resp;
  ::grpc::ServerContext     ctx;
  assert(s.admin.Health(&ctx, &req, &resp).ok());
  assert(resp.serving());
  assert(resp.store_ok());
  assert(resp.store_backend() == "memory");
  assert(resp.store_error().empty());
}

void TestToStatusMapsTaxonomy() {
  using weave::grpc::ToStatus;

  assert(ToStatus(weave::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(weave::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(weave::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(weave::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(weave::util::ConcurrencyConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(weave::util::StoreUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestThrowIfErrorRestoresExceptions() {
  using weave::grpc::ThrowIfError;

  ThrowIfError(::grpc::Status::OK, "noop");

  bool threw = false;
  try {
    ThrowIfError(::grpc::Status(::grpc::StatusCode::NOT_FOUND, "gone"), "GetStatus");
  } catch (const weave::util::NotFound& e) {
    threw = std::string(e.what()).find("GetStatus failed: gone") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    ThrowIfError(::grpc::Status(::grpc::StatusCode::FAILED_PRECONDITION, "closed"), "RequestCancel");
  } catch (const weave::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ThrowIfError(::grpc::Status(::grpc::StatusCode::DEADLINE_EXCEEDED, "slow"), "GetResult");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestGetStatusOfMissingWorkflowReturnsNotFound();
  TestStartAndStatusRoundTrip();
  TestDuplicateStartReturnsAlreadyExists();
  TestEmptyWorkflowTypeReturnsInvalidArgument();
  TestCancelClosedWorkflowReturnsFailedPrecondition();
  TestGetResultReportsTerminatedFailure();
  TestHistoryOfMissingWorkflowReturnsNotFound();
  TestStatsReturnsOk();
  TestSignalRoutesToRunAndRejectsClosed();
  TestHealthReportsStore();
  TestToStatusMapsTaxonomy();
  TestThrowIfErrorRestoresExceptions();

  std::cout << "weave_unit_grpc_status: pass\n";
  return 0;
}
