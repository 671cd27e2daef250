#include "internal/samples/simple_workflow.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>

#include "test_engine.hpp"

namespace {

using namespace weave::v1;
using google::protobuf::Struct;
using weave::testing::TestEngine;
using weave::util::Millis;

Struct Parse(const std::string& json) {
  Struct object;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &object);
  assert(status.ok());
  return object;
}

const google::protobuf::Value& Field(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  assert(it != object.fields().end());
  return it->second;
}

std::string Run(TestEngine& engine, const std::string& workflow_id, const std::string& input) {
  weave::core::StartWorkflowOptions options;
  options.workflow_id = workflow_id;
  engine.orchestrator->StartWorkflow(weave::samples::kSimpleWorkflowType, input, options);
  assert(engine.DriveUntilClosed(workflow_id));
  return workflow_id;
}

void TestValidInputRunsAllThreeSteps() {
  TestEngine engine;
  weave::samples::RegisterSimpleWorkflow(*engine.workflows, *engine.activities);
  engine.MakeWorker();

  Run(engine, "wf-ok", R"({"request_id":"req-7","user_id":"u-1","parameters":{"required_field":"abc"}})");

  auto outcome = engine.orchestrator->GetResult("wf-ok", Millis(0));
  assert(outcome.run.status == WORKFLOW_STATUS_COMPLETED);

  const Struct result = Parse(outcome.run.result);
  assert(Field(result, "workflow_id").string_value() == "req-7");
  assert(Field(result, "user_id").string_value() == "u-1");
  assert(Field(Field(result, "validation").struct_value(), "valid").bool_value());

  const auto& processing = Field(result, "processing").struct_value();
  assert(Field(processing, "processed").bool_value());
  assert(Field(Field(processing, "data").struct_value(), "processed_value").string_value() == "ABC");

  const auto& storage = Field(result, "storage").struct_value();
  assert(Field(storage, "stored").bool_value());
  assert(Field(storage, "storage_id").string_value().rfind("storage_", 0) == 0);

  assert(engine.CountEvents("wf-ok", EVENT_TYPE_ACTIVITY_COMPLETED) == 3);
}

void TestWorkflowIdFallsBackToRunWorkflowId() {
  TestEngine engine;
  weave::samples::RegisterSimpleWorkflow(*engine.workflows, *engine.activities);
  engine.MakeWorker();

  Run(engine, "wf-noreq", R"({"parameters":{"required_field":"x"}})");
  const Struct result = Parse(engine.orchestrator->GetResult("wf-noreq", Millis(0)).run.result);
  assert(Field(result, "workflow_id").string_value() == "wf-noreq");
}

void TestMissingFieldFailsValidation() {
  TestEngine engine;
  weave::samples::RegisterSimpleWorkflow(*engine.workflows, *engine.activities);
  engine.MakeWorker();

  Run(engine, "wf-missing", R"({"parameters":{"other":"x"}})");
  auto outcome = engine.orchestrator->GetResult("wf-missing", Millis(0));
  assert(outcome.run.status == WORKFLOW_STATUS_FAILED);
  assert(outcome.failure->category() == weave::samples::kValidationErrorCategory);
  assert(outcome.failure->message() == "Input validation failed: Missing required field");

  // validation only; processing never scheduled
  assert(engine.CountEvents("wf-missing", EVENT_TYPE_ACTIVITY_SCHEDULED) == 1);
}

void TestEmptyParametersFailValidation() {
  TestEngine engine;
  weave::samples::RegisterSimpleWorkflow(*engine.workflows, *engine.activities);
  engine.MakeWorker();

  Run(engine, "wf-empty", "{}");
  auto outcome = engine.orchestrator->GetResult("wf-empty", Millis(0));
  assert(outcome.run.status == WORKFLOW_STATUS_FAILED);
  assert(outcome.failure->message() == "Input validation failed: No parameters provided");
}

void TestMalformedInputFailsWorkflow() {
  TestEngine engine;
  weave::samples::RegisterSimpleWorkflow(*engine.workflows, *engine.activities);
  engine.MakeWorker();

  Run(engine, "wf-bad", "not json");
  auto outcome = engine.orchestrator->GetResult("wf-bad", Millis(0));
  assert(outcome.run.status == WORKFLOW_STATUS_FAILED);
  assert(outcome.failure->category() == weave::workflow::kWorkflowErrorCategory);
}

} // namespace

int main() {
  TestValidInputRunsAllThreeSteps();
  TestWorkflowIdFallsBackToRunWorkflowId();
  TestMissingFieldFailsValidation();
  TestEmptyParametersFailValidation();
  TestMalformedInputFailsWorkflow();

  std::cout << "weave_unit_simple_workflow: pass\n";
  return 0;
}
