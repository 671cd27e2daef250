#pragma once

#include <cstdint>
#include <string>

#include "weave/v1/common.pb.h"

namespace weave::db::model {

/*
  Persistent workflow run row.

  IMPORTANT:
  - This is a projection of the run's event log, written only by the
    event log inside the same transaction as the events it reflects.
  - last_sequence is the event log version used for optimistic appends.
*/

struct RunRecord {
  std::string run_id;
  std::string workflow_id;
  std::string workflow_type;
  std::string task_queue;
  std::string input;

  weave::v1::WorkflowStatus status = weave::v1::WORKFLOW_STATUS_UNSPECIFIED;

  uint64_t last_sequence = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
  uint64_t closed_at_ms  = 0;

  // 0 = no execution timeout
  uint64_t execution_deadline_ms = 0;

  // Close payloads: result bytes on completion, serialized weave.v1.Failure otherwise.
  std::string result;
  std::string failure;
};

}
