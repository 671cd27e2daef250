#include "simple_workflow.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include <algorithm>
#include <cctype>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace weave::samples {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

Struct ParseObject(const std::string& json, const std::string& what) {
  Struct object;
  if (json.empty()) return object;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &object);
  if (!status.ok()) {
    throw util::InvalidArgument(what + " is not a JSON object: " + status.ToString());
  }
  return object;
}

std::string ToJson(const Struct& object) {
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode JSON: " + status.ToString());
  }
  return json;
}

Value StructValue(const Struct& object) {
  Value value;
  *value.mutable_struct_value() = object;
  return value;
}

Value StringValue(const std::string& s) {
  Value value;
  value.set_string_value(s);
  return value;
}

Value BoolValue(bool b) {
  Value value;
  value.set_bool_value(b);
  return value;
}

std::string GetString(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != Value::kStringValue) return {};
  return it->second.string_value();
}

workflow::ActivityOptions StartToClose(std::chrono::minutes limit) {
  weave::v1::ActivityTimeouts timeouts;
  *timeouts.mutable_start_to_close() = util::ToProto(std::chrono::duration_cast<util::Millis>(limit));

  workflow::ActivityOptions options;
  options.timeouts = timeouts;
  return options;
}

} // namespace

void SimpleWorkflow::Run(workflow::WorkflowContext& ctx) {
  const Struct input      = ParseObject(ctx.Input(), "workflow input");
  Struct       parameters;
  if (auto it = input.fields().find("parameters"); it != input.fields().end() && it->second.has_struct_value()) {
    parameters = it->second.struct_value();
  }
  const std::string parameters_json = ToJson(parameters);

  const Struct validation =
      ParseObject(ctx.ExecuteActivity(kValidateInputActivity, parameters_json, StartToClose(std::chrono::minutes(2))).Get(), "validation result");

  auto valid = validation.fields().find("valid");
  if (valid == validation.fields().end() || !valid->second.bool_value()) {
    const std::string message = GetString(validation, "message");
    ctx.Fail(kValidationErrorCategory, "Input validation failed: " + (message.empty() ? std::string("Unknown error") : message));
    return;
  }

  const std::string processing_json =
      ctx.ExecuteActivity(kProcessDataActivity, parameters_json, StartToClose(std::chrono::minutes(5))).Get();
  const std::string storage_json = ctx.ExecuteActivity(kStoreDataActivity, processing_json, StartToClose(std::chrono::minutes(3))).Get();

  const std::string request_id = GetString(input, "request_id");

  Struct result;
  auto&  fields         = *result.mutable_fields();
  fields["validation"]  = StructValue(validation);
  fields["processing"]  = StructValue(ParseObject(processing_json, "processing result"));
  fields["storage"]     = StructValue(ParseObject(storage_json, "storage result"));
  fields["workflow_id"] = StringValue(request_id.empty() ? ctx.WorkflowId() : request_id);
  fields["user_id"]     = StringValue(GetString(input, "user_id"));

  ctx.Complete(ToJson(result));
}

std::string ValidateInput(worker::ActivityContext& ctx) {
  WEAVE_LOG_INFO("validating input parameters", {observability::StringField("run_id", ctx.RunId())});

  const Struct parameters = ParseObject(ctx.Input(), "parameters");

  Struct result;
  auto&  fields = *result.mutable_fields();
  if (parameters.fields().empty()) {
    fields["valid"]   = BoolValue(false);
    fields["message"] = StringValue("No parameters provided");
  } else if (parameters.fields().find("required_field") == parameters.fields().end()) {
    fields["valid"]   = BoolValue(false);
    fields["message"] = StringValue("Missing required field");
  } else {
    fields["valid"]   = BoolValue(true);
    fields["message"] = StringValue("Input validation successful");
  }
  return ToJson(result);
}

std::string ProcessData(worker::ActivityContext& ctx) {
  WEAVE_LOG_INFO("processing data", {observability::StringField("run_id", ctx.RunId())});

  const Struct parameters = ParseObject(ctx.Input(), "parameters");

  std::string value = GetString(parameters, "required_field");
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  Struct data;
  auto&  data_fields            = *data.mutable_fields();
  data_fields["original"]        = StructValue(parameters);
  data_fields["processed_at"]    = StringValue(google::protobuf::util::TimeUtil::ToString(util::ToProto(util::Now())));
  data_fields["processed_value"] = StringValue(value);

  Struct result;
  (*result.mutable_fields())["processed"] = BoolValue(true);
  (*result.mutable_fields())["data"]      = StructValue(data);
  return ToJson(result);
}

std::string StoreData(worker::ActivityContext& ctx) {
  WEAVE_LOG_INFO("storing processed data", {observability::StringField("run_id", ctx.RunId())});

  // must at least be well-formed
  ParseObject(ctx.Input(), "processed data");

  Struct result;
  auto&  fields        = *result.mutable_fields();
  fields["stored"]     = BoolValue(true);
  fields["storage_id"] = StringValue("storage_" + std::to_string(util::NowMillis()));
  fields["message"]    = StringValue("Data stored successfully");
  return ToJson(result);
}

void RegisterSimpleWorkflow(workflow::WorkflowRegistry& workflows, workflow::ActivityRegistry& activities) {
  workflows.Register<SimpleWorkflow>(kSimpleWorkflowType);
  activities.Register(kValidateInputActivity, ValidateInput);
  activities.Register(kProcessDataActivity, ProcessData);
  activities.Register(kStoreDataActivity, StoreData);
}

} // namespace weave::samples
