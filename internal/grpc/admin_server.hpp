#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "weave/v1/admin_service.grpc.pb.h"

namespace weave::grpc {

class AdminServer final : public weave::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<weave::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*, const weave::v1::StatsRequest*, weave::v1::StatsResponse*) override;
  ::grpc::Status Health(::grpc::ServerContext*, const weave::v1::HealthRequest*, weave::v1::HealthResponse*) override;

 private:
  std::shared_ptr<weave::service::AdminService> service_;
};

} // namespace weave::grpc
