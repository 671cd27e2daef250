#pragma once

#include "workflow_context.hpp"

namespace weave::workflow {

/*
  Workflow author entry point.

  Run() is re-executed from the top on every decision cycle and must be
  deterministic: same history, same calls in the same order. Returning
  while no activity or timer is outstanding completes the workflow with
  an empty result unless Complete()/Fail() was called.
*/
class WorkflowDefinition {
 public:
  virtual ~WorkflowDefinition() = default;

  virtual void Run(WorkflowContext& ctx) = 0;
};

} // namespace weave::workflow
