#include "activity_context.hpp"

namespace weave::worker {

ActivityContext::ActivityContext(weave::v1::ActivityTask task, uint32_t delivery, util::TimePoint deadline, std::string previous_details,
                                 HeartbeatFn heartbeat)
    : task_(std::move(task)),
      delivery_(delivery),
      deadline_(deadline),
      previous_details_(std::move(previous_details)),
      heartbeat_(std::move(heartbeat)) {
}

bool ActivityContext::IsDeadlineExceeded() const {
  return util::Now() >= deadline_;
}

void ActivityContext::Heartbeat(const std::string& details) {
  if (heartbeat_) heartbeat_(details);
}

} // namespace weave::worker
