#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace weave::grpc {

AdminServer::AdminServer(std::shared_ptr<weave::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const weave::v1::StatsRequest* req, weave::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Health(::grpc::ServerContext*, const weave::v1::HealthRequest* req, weave::v1::HealthResponse* resp) {
  try {
    *resp = service_->Health(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace weave::grpc
