// Repository: Reelmix
// Component: reelmix_server
// Purpose: Hosts ClipSelectionService on a gRPC listen address.
// Copyright (c) 2026 Reelmix contributors

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "clip_selection_service.h"
#include "reelmix/media/DurationProbe.hpp"
#include "reelmix/util/Logger.hpp"
#include "reelmix/util/TerminationWatcher.hpp"

namespace {

constexpr const char* kDefaultListenAddress = "0.0.0.0:50061";

std::atomic<bool> g_termination_requested{false};

// Only the flag is touched here; Server::Shutdown() runs on the watcher thread.
void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string listen = kDefaultListenAddress;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--listen" && i + 1 < argc) {
      listen = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cerr << "Usage: " << argv[0] << " [--listen HOST:PORT]\n";
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return 1;
    }
  }

  auto probe = std::make_shared<reelmix::media::FFmpegDurationProbe>();
  reelmix::service::ClipSelectionServiceImpl service(probe);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(listen, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    reelmix::util::Logger::Error("[reelmix_server] LISTEN_FAILED address=" + listen);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  reelmix::util::Logger::Info("[reelmix_server] LISTENING address=" + listen);

  reelmix::util::TerminationWatcher watcher(g_termination_requested, [&server] {
    reelmix::util::Logger::Info("[reelmix_server] SHUTDOWN_REQUESTED");
    server->Shutdown();
  });

  server->Wait();
  reelmix::util::Logger::Info("[reelmix_server] STOPPED");
  return 0;
}
