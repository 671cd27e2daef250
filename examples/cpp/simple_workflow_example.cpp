#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <iostream>
#include <string>

#include "client/cpp/weave_client.h"
#include "weave/v1.hpp"

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target = argc > 1 ? argv[1] : "localhost:7233";

  weave::client::WeaveClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  try {
    const std::string input = R"({"request_id":"example-1","user_id":"user-42","parameters":{"required_field":"hello"}})";
    const auto        started = client.StartWorkflow("SimpleWorkflow", input);
    std::cout << "started workflow_id=" << started.workflow_id() << " run_id=" << started.run_id() << '\n';

    // Poll in bounded waits until the run closes.
    for (int attempt = 0; attempt < 12; ++attempt) {
      const auto outcome = client.GetResult(started.workflow_id(), std::chrono::seconds(5));
      if (outcome.still_running()) continue;

      if (outcome.has_failure()) {
        std::cerr << "workflow failed: " << outcome.failure().category() << ": " << outcome.failure().message() << '\n';
        return 1;
      }
      std::cout << "result=" << outcome.result() << '\n';
      return 0;
    }

    std::cerr << "workflow still running after 60s\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "request failed: " << e.what() << '\n';
    return 1;
  }
}
