#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "command.hpp"
#include "workflow_definition.hpp"
#include "weave/v1/history.pb.h"

namespace weave::workflow {

struct WorkflowState {
  // status once the returned commands are applied
  weave::v1::WorkflowStatus status = weave::v1::WORKFLOW_STATUS_RUNNING;

  uint64_t history_length   = 0;
  bool     cancel_requested = false;

  // activities and timers the workflow is blocked on
  size_t pending = 0;

  // signal name when suspended in WaitForSignal
  std::string awaited_signal;
};

struct ReplayResult {
  WorkflowState        state;
  std::vector<Command> commands;
};

/*
  Re-executes the definition against the recorded history.

  Pure: no I/O, no clock reads, identical output for identical input.
  Only commands not yet reflected in history are returned.

  Throws NondeterminismDetected when the calls made by the definition
  disagree with the recorded schedules.
*/
ReplayResult Replay(WorkflowDefinition& definition, const std::string& run_id, const std::vector<weave::v1::HistoryEvent>& history);

} // namespace weave::workflow
