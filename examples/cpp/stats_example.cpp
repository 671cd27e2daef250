#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/weave_client.h"

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:7233";

  weave::client::WeaveClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  try {
    const auto stats = client.Stats();
    std::cout << "running=" << stats.runs_running() << " completed=" << stats.runs_completed() << " failed=" << stats.runs_failed()
              << " terminated=" << stats.runs_terminated() << " timed_out=" << stats.runs_timed_out() << '\n';
    for (const auto& queue : stats.queues()) {
      std::cout << queue.queue_name() << ": ready=" << queue.ready() << " leased=" << queue.leased() << " delayed=" << queue.delayed() << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "Stats failed: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
