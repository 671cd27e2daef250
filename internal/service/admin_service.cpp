#include "admin_service.hpp"

#include "internal/core/orchestrator.hpp"
#include "internal/observability/logging.hpp"

namespace weave::service {

using namespace weave::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  try {
    const auto stats = ctx_.orchestrator->Stats();

    StatsResponse resp;
    resp.set_runs_running(stats.runs_running);
    resp.set_runs_completed(stats.runs_completed);
    resp.set_runs_failed(stats.runs_failed);
    resp.set_runs_terminated(stats.runs_terminated);
    resp.set_runs_timed_out(stats.runs_timed_out);

    for (const auto& depth : stats.queues) {
      auto* queue = resp.add_queues();
      queue->set_queue_name(depth.queue_name);
      queue->set_ready(depth.ready);
      queue->set_leased(depth.leased);
      queue->set_delayed(depth.delayed);
    }
    return resp;
  } catch (const std::exception& ex) {
    WEAVE_LOG_ERROR("RPC failed",
                    {weave::observability::StringField("route", "AdminService.Stats"), weave::observability::StringField("error", ex.what())});
    throw;
  }
}

HealthResponse AdminService::Health(const HealthRequest&) {
  const auto store = ctx_.orchestrator->CheckStore();

  HealthResponse resp;
  resp.set_store_ok(store.ok);
  resp.set_serving(store.ok);
  resp.set_store_backend(ctx_.store_backend);
  if (!store.ok) resp.set_store_error(store.error);
  resp.set_uptime_seconds(std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_).count());
  return resp;
}

} // namespace weave::service
