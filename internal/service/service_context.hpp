#pragma once

#include <memory>
#include <string>

namespace weave::core {
class Orchestrator;
}

namespace weave::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<weave::core::Orchestrator> orchestrator;
  std::string                                store_backend; // "memory", "sqlite" or "postgres"
};

} // namespace weave::service
