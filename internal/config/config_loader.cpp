#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/retry/retry_policy.hpp"
#include "internal/util/time.hpp"

namespace weave::config {

using weave::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  if (yaml.IsNull()) {
    json_value.mutable_struct_value();
  } else {
    YamlToProtoValue(yaml, &json_value);
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + to_json_status.ToString());
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + status.ToString());
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  using std::chrono::milliseconds;
  using weave::util::ToProto;

  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:7233");
  }

  if (config.database().backend_case() == weave::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
  if (logging->console().empty()) logging->set_console("stdout");
  if (logging->flush_level().empty()) logging->set_flush_level("warn");

  auto* worker = config.mutable_worker();
  if (worker->task_queue().empty()) worker->set_task_queue("default");
  if (worker->decision_pollers() == 0) worker->set_decision_pollers(2);
  if (worker->activity_pollers() == 0) worker->set_activity_pollers(4);
  if (!worker->has_poll_wait()) *worker->mutable_poll_wait() = ToProto(milliseconds(1000));
  if (!worker->has_heartbeat_interval()) *worker->mutable_heartbeat_interval() = ToProto(milliseconds(1000));
  if (!worker->has_decision_visibility_timeout()) *worker->mutable_decision_visibility_timeout() = ToProto(milliseconds(10000));
  if (!worker->has_start_to_close_grace()) *worker->mutable_start_to_close_grace() = ToProto(milliseconds(2000));

  auto* engine = config.mutable_engine();
  if (!engine->has_sweep_interval()) *engine->mutable_sweep_interval() = ToProto(milliseconds(1000));
  if (engine->history_page_size() == 0) engine->set_history_page_size(256);

  *engine->mutable_default_retry_policy()      = retry::Merge(engine->default_retry_policy(), retry::DefaultRetryPolicy());
  *engine->mutable_default_activity_timeouts() = retry::Merge(engine->default_activity_timeouts(), retry::DefaultActivityTimeouts());

  if (engine->workflow_id_reuse_policy() == weave::v1::WORKFLOW_ID_REUSE_POLICY_UNSPECIFIED) {
    engine->set_workflow_id_reuse_policy(weave::v1::WORKFLOW_ID_REUSE_POLICY_REJECT_DUPLICATE);
  }
}

} // namespace weave::config
