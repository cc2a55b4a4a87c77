/**
 * @file endpoint.hpp
 * @brief One mirroring device: session, frame throttle, control channel,
 *        receive path and periodic device-info announcements.
 *
 * Both roles use the same type. A broadcaster feeds SubmitFrame() from its
 * capture thread; a viewer reads the latest received frame and issues
 * control commands. Inbound payloads are classified once and dispatched to
 * the control channel, the frame buffer or the remote device record.
 */

#ifndef MIRROR_ENDPOINT_HPP_
#define MIRROR_ENDPOINT_HPP_

#include "mirror/config.hpp"
#include "mirror/control_channel.hpp"
#include "mirror/frame_throttle.hpp"
#include "mirror/image_encoder.hpp"
#include "mirror/log.hpp"
#include "mirror/quality.hpp"
#include "mirror/session.hpp"
#include "mirror/timer.hpp"
#include "mirror/transport.hpp"
#include "mirror/wire_codec.hpp"

#include <cstdint>
#include <mutex>
#include <utility>
#include <variant>
#include <vector>

namespace mirror {

// ============================================================================
// MediaSink
// ============================================================================

using MediaSaveCompletion = void (*)(void* ctx, bool saved);

/** @brief Persists received frames (photo library, file system, ...). */
class MediaSink {
 public:
  virtual ~MediaSink() = default;

  /** @brief Save `frame`; `done` runs exactly once, possibly later. */
  virtual void Save(const DecodedFrame& frame, MediaSaveCompletion done,
                    void* ctx) = 0;
};

// ============================================================================
// EndpointConfig
// ============================================================================

struct EndpointConfig {
  SessionConfig session;
  QualityPolicy policy;
  QualityTier default_tier = QualityTier::kBalanced;
  uint32_t announce_interval_ms = 5000;  ///< 0 disables re-announcing.
  DeviceInfo device;
};

/** @brief Endpoint settings from loaded configuration plus identity. */
inline EndpointConfig MakeEndpointConfig(const MirrorConfig& cfg,
                                         const DeviceInfo& device) {
  EndpointConfig out;
  out.session = cfg.session;
  out.policy = cfg.policy;
  out.default_tier = cfg.default_tier;
  out.announce_interval_ms = cfg.announce_interval_ms;
  out.device = device;
  return out;
}

struct ReceiveStats {
  uint64_t frames = 0;
  uint64_t controls = 0;
  uint64_t device_infos = 0;
  uint64_t discarded = 0;
};

// ============================================================================
// Endpoint
// ============================================================================

class Endpoint final {
 public:
  Endpoint(TransportAdapter& transport, ImageEncoder& encoder,
           const EndpointConfig& config, MediaSink* sink = nullptr)
      : config_(config),
        session_(transport, config.session),
        throttle_(session_, encoder, config.policy, config.default_tier),
        control_(session_, throttle_),
        sink_(sink) {
    session_.SetDataHandler(&Endpoint::OnDataThunk, this);
    session_.SetObserver(&Endpoint::OnStateThunk, this);
  }

  ~Endpoint() { Stop(); }

  Endpoint(const Endpoint&) = delete;
  Endpoint& operator=(const Endpoint&) = delete;

  // ==========================================================================
  // Lifecycle
  // ==========================================================================

  /** @brief Start discovery and the device-info announcer. */
  expected<void, SessionError> Start(uint8_t roles = kRoleBoth) {
    if (config_.announce_interval_ms != 0U && timer_.TaskCount() == 0U) {
      auto added =
          timer_.Add(config_.announce_interval_ms, &Endpoint::AnnounceThunk,
                     this);
      if (!added.has_value()) {
        MIRROR_LOG_WARN("Endpoint", "announcer not scheduled (%u)",
                        static_cast<unsigned>(added.get_error()));
      }
    }
    if (timer_.TaskCount() != 0U && !timer_.IsRunning()) {
      (void)timer_.Start();
    }
    return session_.Start(roles);
  }

  void Stop() {
    timer_.Stop();
    session_.Stop();
  }

  // ==========================================================================
  // Send side
  // ==========================================================================

  ThrottleOutcome SubmitFrame(const RawFrame& frame) {
    return throttle_.Process(frame);
  }

  ThrottleOutcome SubmitFrame(const RawFrame& frame, uint64_t now_us) {
    return throttle_.Process(frame, now_us);
  }

  /** @brief Send this device's info to every connected peer, reliably. */
  void AnnounceDeviceInfo() {
    if (!session_.IsConnected()) return;
    const std::vector<uint8_t> bytes =
        WireCodec::EncodeDeviceInfo(config_.device);
    auto r = session_.Send(bytes.data(), bytes.size(), Reliability::kReliable);
    if (!r.has_value()) {
      MIRROR_LOG_DEBUG("Endpoint", "device info not sent (%u)",
                       static_cast<unsigned>(r.get_error()));
    }
  }

  // ==========================================================================
  // Receive side
  // ==========================================================================

  /**
   * @brief Hand the latest received frame to the media sink.
   *
   * Without a frame (or a sink) `done` reports failure immediately.
   */
  void SaveLatestFrame(MediaSaveCompletion done, void* ctx = nullptr) {
    DecodedFrame frame;
    if (sink_ == nullptr || !control_.CopyLatestFrame(frame)) {
      if (done != nullptr) done(ctx, false);
      return;
    }
    sink_->Save(frame, done, ctx);
  }

  /** @brief Most recent DeviceInfo received from a peer; false if none. */
  bool RemoteDevice(DeviceInfo& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_remote_device_) return false;
    out = remote_device_;
    return true;
  }

  ReceiveStats Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
  }

  Session& session() noexcept { return session_; }
  FrameThrottle& throttle() noexcept { return throttle_; }
  ControlChannel& control() noexcept { return control_; }
  const DeviceInfo& device() const noexcept { return config_.device; }

 private:
  static void OnDataThunk(void* ctx, const PeerId& peer, const uint8_t* data,
                          size_t size) {
    static_cast<Endpoint*>(ctx)->OnData(peer, data, size);
  }

  static void OnStateThunk(void* ctx, ConnectionState from,
                           ConnectionState to) {
    static_cast<Endpoint*>(ctx)->OnStateChanged(from, to);
  }

  static void AnnounceThunk(void* ctx) {
    static_cast<Endpoint*>(ctx)->AnnounceDeviceInfo();
  }

  void OnData(const PeerId& peer, const uint8_t* data, size_t size) {
    InboundMessage msg = WireCodec::Classify(data, size);

    if (auto* frame = std::get_if<DecodedFrame>(&msg)) {
      Count(&ReceiveStats::frames);
      control_.OnFrame(std::move(*frame));
    } else if (const auto* ctrl = std::get_if<ControlMessage>(&msg)) {
      Count(&ReceiveStats::controls);
      control_.OnControl(peer, *ctrl);
    } else if (const auto* info = std::get_if<DeviceInfo>(&msg)) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.device_infos;
        remote_device_ = *info;
        has_remote_device_ = true;
      }
      MIRROR_LOG_DEBUG("Endpoint", "device info from %s: %s (%s %s)",
                       peer.name.c_str(), info->name.c_str(),
                       info->model.c_str(), info->system_version.c_str());
    } else {
      Count(&ReceiveStats::discarded);
      MIRROR_LOG_DEBUG("Endpoint", "discarded %zu bytes from %s (%u)", size,
                       peer.name.c_str(),
                       static_cast<unsigned>(std::get<Discarded>(msg).reason));
    }
  }

  void OnStateChanged(ConnectionState from, ConnectionState to) {
    (void)from;
    if (to == ConnectionState::kConnected) {
      AnnounceDeviceInfo();
    } else if (to == ConnectionState::kDisconnected ||
               to == ConnectionState::kFailed) {
      control_.ResetRemote();
    }
  }

  void Count(uint64_t ReceiveStats::*counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++(stats_.*counter);
  }

  EndpointConfig config_;
  Session session_;
  FrameThrottle throttle_;
  ControlChannel control_;
  MediaSink* sink_;
  DeviceInfo remote_device_;
  bool has_remote_device_ = false;
  ReceiveStats stats_;
  mutable std::mutex mutex_;
  TimerScheduler timer_;  // Declared last: stops before the rest is torn down.
};

}  // namespace mirror

#endif  // MIRROR_ENDPOINT_HPP_
