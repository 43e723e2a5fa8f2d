// Repository: Mediacore-player
// Component: PlayerControl gRPC Service Implementation
// Purpose: Exposes the playback controller and its event surface over gRPC.
// Copyright (c) 2025 Mediacore

#include "player_service.h"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

#include "mediacore/buffer/Channel.hpp"
#include "mediacore/buffer/MediaTypes.h"
#include "mediacore/util/Logger.hpp"

namespace mediacore
{
  namespace player
  {

    namespace
    {
      constexpr char kEngineUnavailable[] = "engine unavailable";
      constexpr auto kSubscriberPollInterval = std::chrono::milliseconds(100);

      PlaybackState ToProtoState(runtime::PlaybackState state)
      {
        switch (state)
        {
        case runtime::PlaybackState::kPlaying:
          return PLAYBACK_STATE_PLAYING;
        case runtime::PlaybackState::kPaused:
          return PLAYBACK_STATE_PAUSED;
        case runtime::PlaybackState::kEnded:
          return PLAYBACK_STATE_ENDED;
        case runtime::PlaybackState::kStopped:
          break;
        }
        return PLAYBACK_STATE_STOPPED;
      }
    } // namespace

    PlayerControlImpl::PlayerControlImpl(std::shared_ptr<runtime::PlaybackController> controller,
                                         std::chrono::milliseconds pump_interval)
        : controller_(std::move(controller)),
          pump_interval_(pump_interval)
    {
      event_pump_thread_ = std::thread(&PlayerControlImpl::EventPumpLoop, this);
    }

    PlayerControlImpl::~PlayerControlImpl()
    {
      Shutdown();
    }

    void PlayerControlImpl::Shutdown()
    {
      if (shutting_down_.exchange(true))
      {
        return;
      }

      if (event_pump_thread_.joinable())
      {
        event_pump_thread_.join();
      }

      // The forwarder ends once the engine closes the outlet, which a stop does.
      runtime::ControllerResult stopped = controller_->Stop();
      if (!stopped.success)
      {
        util::Logger::Warn("[PlayerControl] Stop during shutdown failed: " + stopped.message);
      }
      std::lock_guard<std::mutex> lock(load_mutex_);
      if (frame_forwarder_thread_.joinable())
      {
        frame_forwarder_thread_.join();
      }
      util::Logger::Info("[PlayerControl] Service shut down");
    }

    grpc::Status PlayerControlImpl::LoadFile(grpc::ServerContext *context,
                                             const LoadFileRequest *request,
                                             PlayerStatus *response)
    {
      util::Logger::Info("[LoadFile] Request received: path=" + request->path());

      std::lock_guard<std::mutex> lock(load_mutex_);
      if (shutting_down_.load())
      {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "service shutting down");
      }

      auto outlet = std::make_shared<buffer::Channel<buffer::VideoFrame>>();
      auto result = controller_->Load(request->path(), outlet);

      // Load stopped the previous session first, so its outlet is closed and
      // the old forwarder is draining out.
      if (frame_forwarder_thread_.joinable())
      {
        frame_forwarder_thread_.join();
      }

      FillStatus(result.status, response);
      if (!result.success)
      {
        return ToGrpcStatus(result);
      }

      if (result.status.has_video)
      {
        frame_forwarder_thread_ = std::thread(&PlayerControlImpl::ForwardFrames, this, outlet);
      }

      std::ostringstream oss;
      oss << "[LoadFile] Loaded " << request->path() << " duration=" << result.status.duration << "s";
      util::Logger::Info(oss.str());
      return grpc::Status::OK;
    }

    grpc::Status PlayerControlImpl::Play(grpc::ServerContext *context,
                                         const PlayRequest *request,
                                         PlayerStatus *response)
    {
      auto result = controller_->Play();
      FillStatus(result.status, response);
      return ToGrpcStatus(result);
    }

    grpc::Status PlayerControlImpl::Pause(grpc::ServerContext *context,
                                          const PauseRequest *request,
                                          PlayerStatus *response)
    {
      auto result = controller_->Pause();
      FillStatus(result.status, response);
      return ToGrpcStatus(result);
    }

    grpc::Status PlayerControlImpl::TogglePlayback(grpc::ServerContext *context,
                                                   const TogglePlaybackRequest *request,
                                                   TogglePlaybackResponse *response)
    {
      auto result = controller_->TogglePlayback();
      response->set_is_playing(result.is_playing);
      return ToGrpcStatus(result);
    }

    grpc::Status PlayerControlImpl::Stop(grpc::ServerContext *context,
                                         const StopRequest *request,
                                         PlayerStatus *response)
    {
      util::Logger::Info("[Stop] Request received");
      auto result = controller_->Stop();
      FillStatus(result.status, response);
      return ToGrpcStatus(result);
    }

    grpc::Status PlayerControlImpl::SeekTo(grpc::ServerContext *context,
                                           const SeekToRequest *request,
                                           SeekToResponse *response)
    {
      auto result = controller_->Seek(request->position());
      response->set_position(result.position);
      return ToGrpcStatus(result);
    }

    grpc::Status PlayerControlImpl::SetVolume(grpc::ServerContext *context,
                                              const SetVolumeRequest *request,
                                              SetVolumeResponse *response)
    {
      auto result = controller_->SetVolume(request->level());
      response->set_level(result.volume);
      return ToGrpcStatus(result);
    }

    grpc::Status PlayerControlImpl::GetPlayerStatus(grpc::ServerContext *context,
                                                    const GetPlayerStatusRequest *request,
                                                    PlayerStatus *response)
    {
      FillStatus(controller_->Status(), response);
      return grpc::Status::OK;
    }

    grpc::Status PlayerControlImpl::SubscribeEvents(grpc::ServerContext *context,
                                                    const SubscribeEventsRequest *request,
                                                    grpc::ServerWriter<PlayerEvent> *writer)
    {
      {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        subscribers_.push_back(writer);
      }
      util::Logger::Info("[SubscribeEvents] Subscriber attached");

      while (!context->IsCancelled() && !shutting_down_.load())
      {
        std::this_thread::sleep_for(kSubscriberPollInterval);
      }

      // After this the writer is never touched again.
      {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), writer),
                           subscribers_.end());
      }
      util::Logger::Info("[SubscribeEvents] Subscriber detached");
      return grpc::Status::OK;
    }

    void PlayerControlImpl::EventPumpLoop()
    {
      while (!shutting_down_.load())
      {
        runtime::PumpCounts counts = controller_->PumpEvents();
        if (counts.end_of_stream > 0)
        {
          PlayerEvent event;
          event.mutable_end_of_stream()->set_file_path(controller_->Status().file_path);
          Broadcast(event);
        }
        std::this_thread::sleep_for(pump_interval_);
      }
    }

    void PlayerControlImpl::ForwardFrames(runtime::VideoOutlet outlet)
    {
      buffer::VideoFrame frame;
      uint64_t forwarded = 0;
      while (outlet->Receive(frame))
      {
        PlayerEvent event;
        VideoFrame *out = event.mutable_video_frame();
        out->set_width(frame.width);
        out->set_height(frame.height);
        out->set_pixels(frame.pixels.data(), frame.pixels.size());
        out->set_timestamp(frame.timestamp);
        Broadcast(event);
        ++forwarded;
      }
      util::Logger::Debug("[PlayerControl] Frame forwarder finished after " +
                          std::to_string(forwarded) + " frames");
    }

    void PlayerControlImpl::Broadcast(const PlayerEvent &event)
    {
      std::lock_guard<std::mutex> lock(subscribers_mutex_);
      for (auto it = subscribers_.begin(); it != subscribers_.end();)
      {
        if ((*it)->Write(event))
        {
          ++it;
        }
        else
        {
          util::Logger::Warn("[SubscribeEvents] Write failed; dropping subscriber");
          it = subscribers_.erase(it);
        }
      }
    }

    void PlayerControlImpl::FillStatus(const runtime::PlayerStatus &status, PlayerStatus *out)
    {
      out->set_is_playing(status.is_playing);
      out->set_current_time(status.current_time);
      out->set_duration(status.duration);
      out->set_volume(status.volume);
      out->set_file_path(status.file_path);
      out->set_has_video(status.has_video);
      out->set_has_audio(status.has_audio);
      out->set_video_width(status.video_width);
      out->set_video_height(status.video_height);
      out->set_state(ToProtoState(status.state));
    }

    grpc::Status PlayerControlImpl::ToGrpcStatus(const runtime::ControllerResult &result)
    {
      if (result.success)
      {
        return grpc::Status::OK;
      }
      grpc::StatusCode code = grpc::StatusCode::FAILED_PRECONDITION;
      if (result.message.find(kEngineUnavailable) != std::string::npos)
      {
        code = grpc::StatusCode::UNAVAILABLE;
      }
      return grpc::Status(code, result.message);
    }

  } // namespace player
} // namespace mediacore
