#pragma once

#include <chrono>

#include "service_context.hpp"
#include "weave/v1/admin_service.pb.h"

namespace weave::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  weave::v1::StatsResponse Stats(const weave::v1::StatsRequest& req);

  // Serving while the store answers; never throws for a store outage.
  weave::v1::HealthResponse Health(const weave::v1::HealthRequest& req);

 private:
  ServiceContext                        ctx_;
  std::chrono::steady_clock::time_point started_ = std::chrono::steady_clock::now();
};

} // namespace weave::service
