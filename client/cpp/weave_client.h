#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "weave/v1.hpp"
#include "weave/v1/admin_service.grpc.pb.h"
#include "weave/v1/workflow_service.grpc.pb.h"

namespace weave::client {

/*
  Thin synchronous client over WorkflowService and AdminService.

  Non-OK statuses are rethrown as the weave::util exception matching the
  status code (NotFound, AlreadyExists, InvalidState, ...).
*/
class WeaveClient {
 public:
  explicit WeaveClient(std::shared_ptr<::grpc::Channel> channel);

  weave::v1::StartWorkflowResponse StartWorkflow(const weave::v1::StartWorkflowRequest& request) const;

  // Convenience overload; empty workflow_id lets the server choose one.
  weave::v1::StartWorkflowResponse StartWorkflow(const std::string& workflow_type, const std::string& input,
                                                 const std::string& workflow_id = {}, const std::string& task_queue = {}) const;

  weave::v1::GetStatusResponse GetStatus(const std::string& workflow_id) const;

  // Blocks up to `wait` for the run to close.
  weave::v1::GetResultResponse GetResult(const std::string& workflow_id,
                                         std::chrono::milliseconds wait = std::chrono::milliseconds(0)) const;

  weave::v1::GetHistoryResponse GetHistory(const std::string& workflow_id, uint64_t from_sequence = 0) const;

  void RequestCancel(const std::string& workflow_id, const std::string& reason) const;
  void SignalWorkflow(const std::string& workflow_id, const std::string& signal_name, const std::string& payload = {}) const;
  void Terminate(const std::string& workflow_id, const std::string& reason) const;

  weave::v1::StatsResponse  Stats() const;
  weave::v1::HealthResponse Health() const;

 private:
  std::unique_ptr<weave::v1::WorkflowService::Stub> workflow_stub_;
  std::unique_ptr<weave::v1::AdminService::Stub>    admin_stub_;
};

} // namespace weave::client
