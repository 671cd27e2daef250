#include "server.hpp"

#include <stdexcept>

#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/workflow_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/workflow_service.hpp"

namespace weave::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials());

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  WEAVE_LOG_INFO("gRPC server listening", {weave::observability::StringField("bind_address", bind_address_)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

std::vector<std::unique_ptr<::grpc::Service>> BuildServices(std::shared_ptr<weave::core::Orchestrator> orchestrator, std::string store_backend) {
  service::ServiceContext ctx;
  ctx.orchestrator  = std::move(orchestrator);
  ctx.store_backend = std::move(store_backend);

  auto workflow_service = std::make_shared<service::WorkflowService>(ctx);
  auto admin_service    = std::make_shared<service::AdminService>(ctx);

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<weave::grpc::WorkflowServer>(workflow_service));
  services.push_back(std::make_unique<weave::grpc::AdminServer>(admin_service));
  return services;
}

} // namespace weave::runtime
