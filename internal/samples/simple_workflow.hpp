#pragma once

#include <string>

#include "internal/worker/activity_context.hpp"
#include "internal/workflow/registry.hpp"
#include "internal/workflow/workflow_definition.hpp"

namespace weave::samples {

inline constexpr const char* kSimpleWorkflowType      = "SimpleWorkflow";
inline constexpr const char* kValidateInputActivity   = "validate_input";
inline constexpr const char* kProcessDataActivity     = "process_data";
inline constexpr const char* kStoreDataActivity       = "store_data";
inline constexpr const char* kValidationErrorCategory = "ValidationError";

/*
  validate_input -> process_data -> store_data

  Input is a JSON object {request_id, user_id, parameters}. The result
  is a JSON object {validation, processing, storage, workflow_id,
  user_id}. Rejected input fails the run with category ValidationError.
*/
class SimpleWorkflow final : public workflow::WorkflowDefinition {
 public:
  void Run(workflow::WorkflowContext& ctx) override;
};

// Activities take and return JSON objects.
std::string ValidateInput(worker::ActivityContext& ctx);
std::string ProcessData(worker::ActivityContext& ctx);
std::string StoreData(worker::ActivityContext& ctx);

void RegisterSimpleWorkflow(workflow::WorkflowRegistry& workflows, workflow::ActivityRegistry& activities);

} // namespace weave::samples
