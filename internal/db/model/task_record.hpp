#pragma once

#include <cstdint>
#include <string>

#include "weave/v1/task.pb.h"

namespace weave::db::model {

/*
  Task queue entry, keyed by (queue_name, task_id).

  visible_at_ms doubles as the delay and the lease-expiry index:
    - never leased:  becomes dequeuable at visible_at_ms
    - leased:        lease lapses at visible_at_ms
  lease_token identifies the current (or last) delivery.
*/
struct TaskRecord {
  std::string queue_name;
  std::string task_id;

  weave::v1::TaskKind kind = weave::v1::TASK_KIND_UNSPECIFIED;

  std::string run_id;
  std::string workflow_id;

  // serialized weave.v1.TaskPayload
  std::string payload;

  uint64_t created_at_ms  = 0;
  uint64_t visible_at_ms  = 0;
  uint32_t delivery_count = 0;

  std::string lease_token;
  uint64_t    lease_started_at_ms = 0;
  uint64_t    heartbeat_at_ms     = 0;
  std::string heartbeat_details;

  bool IsLeased(uint64_t now_ms) const {
    return !lease_token.empty() && visible_at_ms > now_ms;
  }
};

}
