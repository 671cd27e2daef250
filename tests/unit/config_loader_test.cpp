#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"

namespace {

using weave::config::ConfigLoader;
using weave::util::FromProto;
using weave::util::Millis;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "weave_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDefaultsFillEmptyConfig() {
  auto config = ConfigLoader::LoadFromYamlString("server: {}\n");

  assert(config.server().bind_address() == "0.0.0.0:7233");
  assert(config.database().has_memory());
  assert(config.worker().task_queue() == "default");
  assert(config.worker().decision_pollers() == 2);
  assert(config.worker().activity_pollers() == 4);
  assert(FromProto(config.worker().decision_visibility_timeout()) == Millis(10000));
  assert(FromProto(config.worker().start_to_close_grace()) == Millis(2000));
  assert(config.engine().history_page_size() == 256);
  assert(FromProto(config.engine().default_retry_policy().initial_interval()) == Millis(1000));
  assert(config.engine().default_retry_policy().backoff_coefficient() == 2.0);
  assert(FromProto(config.engine().default_retry_policy().maximum_interval()) == Millis(100000));
  assert(FromProto(config.engine().default_activity_timeouts().start_to_close()) == Millis(60000));
  assert(config.engine().workflow_id_reuse_policy() == weave::v1::WORKFLOW_ID_REUSE_POLICY_REJECT_DUPLICATE);
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:9000"
database:
  sqlite:
    path: "/tmp/weave.db"
    wal_mode: true
logging:
  level: "debug"
worker:
  task_queue: "orders"
  decision_pollers: 3
  activity_pollers: 8
  poll_wait: "0.5s"
engine:
  sweep_interval: "2s"
  default_retry_policy:
    maximum_attempts: 5
    non_retryable_categories: ["ValidationError"]
  workflow_id_reuse_policy: "WORKFLOW_ID_REUSE_POLICY_ALLOW_DUPLICATE"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:9000");
  assert(config.database().sqlite().path() == "/tmp/weave.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.worker().task_queue() == "orders");
  assert(config.worker().decision_pollers() == 3);
  assert(config.worker().activity_pollers() == 8);
  assert(FromProto(config.worker().poll_wait()) == Millis(500));
  assert(FromProto(config.engine().sweep_interval()) == Millis(2000));
  assert(config.engine().workflow_id_reuse_policy() == weave::v1::WORKFLOW_ID_REUSE_POLICY_ALLOW_DUPLICATE);

  // explicit fields survive, the rest is merged from engine defaults
  const auto& retry = config.engine().default_retry_policy();
  assert(retry.maximum_attempts() == 5);
  assert(retry.non_retryable_categories_size() == 1);
  assert(retry.non_retryable_categories(0) == "ValidationError");
  assert(FromProto(retry.initial_interval()) == Millis(1000));
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(worker:
  task_queue: "123"
)");
  assert(config.worker().task_queue() == "123");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "0.0.0.0:7233"
unknown_field: 123
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/weave.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaultsFillEmptyConfig();
  TestFullConfigFromFile();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileThrows();

  std::cout << "weave_unit_config_loader: pass\n";
  return 0;
}
