// Repository: Mediacore-player
// Component: PlayerControl gRPC Service Implementation
// Purpose: Exposes the playback controller and its event surface over gRPC.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_PLAYER_SERVICE_H_
#define MEDIACORE_PLAYER_SERVICE_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "player.grpc.pb.h"
#include "player.pb.h"
#include "mediacore/runtime/EngineTypes.h"
#include "mediacore/runtime/PlaybackController.h"

namespace mediacore {
namespace player {

// PlayerControlImpl implements the gRPC service defined in player.proto.
// This is a thin adapter that delegates to PlaybackController.
//
// Two background threads feed SubscribeEvents streams:
// - the frame forwarder drains the current load's video outlet
// - the event pump calls PlaybackController::PumpEvents periodically and
//   announces end of stream
class PlayerControlImpl final : public PlayerControl::Service {
 public:
  explicit PlayerControlImpl(std::shared_ptr<runtime::PlaybackController> controller,
                             std::chrono::milliseconds pump_interval = std::chrono::milliseconds(20));
  ~PlayerControlImpl() override;

  // Disable copy and move
  PlayerControlImpl(const PlayerControlImpl&) = delete;
  PlayerControlImpl& operator=(const PlayerControlImpl&) = delete;

  // RPC implementations
  grpc::Status LoadFile(grpc::ServerContext* context,
                        const LoadFileRequest* request,
                        PlayerStatus* response) override;

  grpc::Status Play(grpc::ServerContext* context,
                    const PlayRequest* request,
                    PlayerStatus* response) override;

  grpc::Status Pause(grpc::ServerContext* context,
                     const PauseRequest* request,
                     PlayerStatus* response) override;

  grpc::Status TogglePlayback(grpc::ServerContext* context,
                              const TogglePlaybackRequest* request,
                              TogglePlaybackResponse* response) override;

  grpc::Status Stop(grpc::ServerContext* context,
                    const StopRequest* request,
                    PlayerStatus* response) override;

  grpc::Status SeekTo(grpc::ServerContext* context,
                      const SeekToRequest* request,
                      SeekToResponse* response) override;

  grpc::Status SetVolume(grpc::ServerContext* context,
                         const SetVolumeRequest* request,
                         SetVolumeResponse* response) override;

  grpc::Status GetPlayerStatus(grpc::ServerContext* context,
                               const GetPlayerStatusRequest* request,
                               PlayerStatus* response) override;

  // Server-streaming RPC; returns when the client cancels or on Shutdown().
  grpc::Status SubscribeEvents(grpc::ServerContext* context,
                               const SubscribeEventsRequest* request,
                               grpc::ServerWriter<PlayerEvent>* writer) override;

  // Stops background threads and releases subscribers. Idempotent.
  void Shutdown();

 private:
  void EventPumpLoop();
  void ForwardFrames(runtime::VideoOutlet outlet);

  // Writes to every subscriber; drops those whose stream has failed.
  void Broadcast(const PlayerEvent& event);

  static void FillStatus(const runtime::PlayerStatus& status, PlayerStatus* out);
  static grpc::Status ToGrpcStatus(const runtime::ControllerResult& result);

  std::shared_ptr<runtime::PlaybackController> controller_;
  std::chrono::milliseconds pump_interval_;

  std::atomic<bool> shutting_down_{false};
  std::thread event_pump_thread_;

  // Serializes LoadFile so the forwarder swap matches the controller's session.
  std::mutex load_mutex_;
  std::thread frame_forwarder_thread_;

  std::mutex subscribers_mutex_;
  std::vector<grpc::ServerWriter<PlayerEvent>*> subscribers_;
};

}  // namespace player
}  // namespace mediacore

#endif  // MEDIACORE_PLAYER_SERVICE_H_
