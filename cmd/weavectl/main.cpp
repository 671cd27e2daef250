#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/weave_client.h"
#include "weave/v1.hpp"

using namespace weave::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  weavectl <addr> start <workflow_type> [input_json] [workflow_id] [task_queue]\n"
            << "  weavectl <addr> status <workflow_id>\n"
            << "  weavectl <addr> result <workflow_id> [wait_ms]\n"
            << "  weavectl <addr> history <workflow_id> [from_sequence]\n"
            << "  weavectl <addr> cancel <workflow_id> [reason]\n"
            << "  weavectl <addr> signal <workflow_id> <signal_name> [payload]\n"
            << "  weavectl <addr> terminate <workflow_id> [reason]\n"
            << "  weavectl <addr> stats\n"
            << "  weavectl <addr> health\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  const auto status                       = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return "<unprintable: " + status.ToString() + ">";
  }
  return json;
}

static int Run(const weave::client::WeaveClient& client, const std::string& cmd, int argc, char** argv) {
  // ------------------------------------------------------------

  if (cmd == "start") {
    if (argc < 4) return 1;

    StartWorkflowRequest req;
    req.set_workflow_type(argv[3]);
    if (argc >= 5) req.set_input(argv[4]);
    if (argc >= 6) req.set_workflow_id(argv[5]);
    if (argc >= 7) req.set_task_queue(argv[6]);

    const auto resp = client.StartWorkflow(req);
    std::cout << "workflow_id=" << resp.workflow_id() << "\n";
    std::cout << "run_id=" << resp.run_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    const auto resp = client.GetStatus(argv[3]);
    std::cout << "run_id=" << resp.run_id() << "\n";
    std::cout << "type=" << resp.workflow_type() << "\n";
    std::cout << "status=" << WorkflowStatus_Name(resp.status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "result") {
    if (argc < 4) return 1;

    const std::chrono::milliseconds wait(argc >= 5 ? std::stoll(argv[4]) : 0);
    const auto                      resp = client.GetResult(argv[3], wait);

    std::cout << "status=" << WorkflowStatus_Name(resp.status()) << "\n";
    if (resp.still_running()) {
      std::cout << "still_running\n";
      return 0;
    }
    if (resp.has_failure()) {
      std::cout << "failure=" << resp.failure().category() << ": " << resp.failure().message() << "\n";
      return 0;
    }
    std::cout << "result=" << resp.result() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    if (argc < 4) return 1;

    const auto resp = client.GetHistory(argv[3], argc >= 5 ? std::stoull(argv[4]) : 0);
    std::cout << "run_id=" << resp.run_id() << "\n";
    for (const auto& event : resp.events()) {
      std::cout << ToJson(event) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    client.RequestCancel(argv[3], argc >= 5 ? argv[4] : "");
    std::cout << "cancel requested\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "signal") {
    if (argc < 5) return 1;

    client.SignalWorkflow(argv[3], argv[4], argc >= 6 ? argv[5] : "");
    std::cout << "signaled\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "terminate") {
    if (argc < 4) return 1;

    client.Terminate(argv[3], argc >= 5 ? argv[4] : "");
    std::cout << "terminated\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    const auto resp = client.Stats();
    std::cout << "running=" << resp.runs_running() << "\n";
    std::cout << "completed=" << resp.runs_completed() << "\n";
    std::cout << "failed=" << resp.runs_failed() << "\n";
    std::cout << "terminated=" << resp.runs_terminated() << "\n";
    std::cout << "timed_out=" << resp.runs_timed_out() << "\n";
    for (const auto& queue : resp.queues()) {
      std::cout << "queue " << queue.queue_name() << " ready=" << queue.ready() << " leased=" << queue.leased()
                << " delayed=" << queue.delayed() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "health") {
    const auto resp = client.Health();
    std::cout << "serving=" << (resp.serving() ? "true" : "false") << "\n";
    std::cout << "store=" << resp.store_backend() << " ok=" << (resp.store_ok() ? "true" : "false") << "\n";
    if (!resp.store_ok()) std::cout << "store_error=" << resp.store_error() << "\n";
    std::cout << "uptime_s=" << resp.uptime_seconds() << "\n";
    return resp.serving() ? 0 : 3;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  weave::client::WeaveClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  try {
    return Run(client, cmd, argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
