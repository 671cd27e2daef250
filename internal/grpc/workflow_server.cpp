#include "workflow_server.hpp"

#include "grpc_error.hpp"

namespace weave::grpc {

using namespace weave::v1;

WorkflowServer::WorkflowServer(std::shared_ptr<weave::service::WorkflowService> svc) : service_(std::move(svc)) {
}

::grpc::Status WorkflowServer::StartWorkflow(::grpc::ServerContext*, const StartWorkflowRequest* req, StartWorkflowResponse* resp) {
  try {
    *resp = service_->StartWorkflow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::GetStatus(::grpc::ServerContext*, const GetStatusRequest* req, GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::GetResult(::grpc::ServerContext*, const GetResultRequest* req, GetResultResponse* resp) {
  try {
    *resp = service_->GetResult(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::GetHistory(::grpc::ServerContext*, const GetHistoryRequest* req, GetHistoryResponse* resp) {
  try {
    *resp = service_->GetHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::RequestCancel(::grpc::ServerContext*, const RequestCancelRequest* req, RequestCancelResponse* resp) {
  try {
    *resp = service_->RequestCancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::SignalWorkflow(::grpc::ServerContext*, const SignalWorkflowRequest* req, SignalWorkflowResponse* resp) {
  try {
    *resp = service_->SignalWorkflow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::Terminate(::grpc::ServerContext*, const TerminateRequest* req, TerminateResponse* resp) {
  try {
    *resp = service_->Terminate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace weave::grpc
