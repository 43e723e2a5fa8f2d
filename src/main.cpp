// Repository: Mediacore-player
// Component: Player Daemon
// Purpose: Hosts the PlayerControl gRPC service over a PlaybackController.
// Copyright (c) 2025 Mediacore

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "mediacore/runtime/PlaybackController.h"
#include "mediacore/util/Logger.hpp"
#include "player_service.h"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string listen_address = "127.0.0.1:50061";
  double volume = 0.8;
  int64_t load_timeout_ms = 0;  // 0 = wait forever
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Local media playback engine exposed over gRPC (PlayerControl).\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --listen ADDR          gRPC listen address (default: 127.0.0.1:50061)\n"
            << "  --volume LEVEL         Initial volume in [0, 1] (default: 0.8)\n"
            << "  --load-timeout-ms MS   Give up on a load after MS milliseconds\n"
            << "                         (default: 0, wait forever)\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  MEDIACORE_DEBUG        Enable debug logging when set\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--listen" && i + 1 < argc) {
      args.listen_address = argv[++i];
    } else if (arg == "--volume" && i + 1 < argc) {
      char* end = nullptr;
      args.volume = std::strtod(argv[++i], &end);
      if (end == argv[i] || *end != '\0') {
        args.error = "Invalid --volume value: " + std::string(argv[i]);
        return args;
      }
    } else if (arg == "--load-timeout-ms" && i + 1 < argc) {
      char* end = nullptr;
      args.load_timeout_ms = std::strtoll(argv[++i], &end, 10);
      if (end == argv[i] || *end != '\0' || args.load_timeout_ms < 0) {
        args.error = "Invalid --load-timeout-ms value: " + std::string(argv[i]);
        return args;
      }
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }

  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  mediacore::runtime::PlayerConfig config;
  config.default_volume = args.volume;
  config.engine.load_timeout = std::chrono::milliseconds(args.load_timeout_ms);

  auto controller = std::make_shared<mediacore::runtime::PlaybackController>(config);
  mediacore::player::PlayerControlImpl service(controller);

  grpc::ServerBuilder builder;
  int selected_port = 0;
  builder.AddListeningPort(args.listen_address, grpc::InsecureServerCredentials(),
                           &selected_port);
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || selected_port == 0) {
    mediacore::util::Logger::Error("[mediacore_player] Failed to listen on " +
                                   args.listen_address);
    service.Shutdown();
    return 1;
  }

  std::ostringstream oss;
  oss << "[mediacore_player] Listening on " << args.listen_address
      << " volume=" << config.default_volume;
  mediacore::util::Logger::Info(oss.str());

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  mediacore::util::Logger::Info("[mediacore_player] Shutting down");
  // Releases streaming subscribers so the server can drain.
  service.Shutdown();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  return 0;
}
