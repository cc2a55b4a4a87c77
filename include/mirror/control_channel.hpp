/**
 * @file control_channel.hpp
 * @brief Stream-state and quality-change signalling between peers, plus the
 *        receive-side state those signals drive.
 *
 * Outbound control messages always travel reliably. A local tier change is
 * announced to the connected peers before it is applied locally; applying
 * it restarts frame pacing. A received tier change is applied without
 * being echoed back.
 */

#ifndef MIRROR_CONTROL_CHANNEL_HPP_
#define MIRROR_CONTROL_CHANNEL_HPP_

#include "mirror/frame_throttle.hpp"
#include "mirror/log.hpp"
#include "mirror/quality.hpp"
#include "mirror/session.hpp"
#include "mirror/wire_codec.hpp"

#include <cstdint>
#include <mutex>
#include <utility>
#include <variant>
#include <vector>

namespace mirror {

class ControlChannel final {
 public:
  ControlChannel(Session& session, FrameThrottle& throttle) noexcept
      : session_(session), throttle_(throttle) {}

  ControlChannel(const ControlChannel&) = delete;
  ControlChannel& operator=(const ControlChannel&) = delete;

  // ==========================================================================
  // Local commands
  // ==========================================================================

  /**
   * @brief Toggle local streaming and tell the peers.
   *
   * Local state changes even when no peer is connected.
   */
  void SetLocalStreaming(bool enabled) {
    SendControl(ControlMessage{StreamState{enabled}});
    throttle_.SetStreaming(enabled);
  }

  /**
   * @brief Notify all connected peers of `tier`, then apply it locally.
   * @return false if `tier` is disabled here; nothing is sent then.
   */
  bool RequestTier(QualityTier tier) {
    if (!throttle_.Policy().IsEnabled(tier)) {
      MIRROR_LOG_WARN("Control", "tier '%s' is disabled", TierName(tier));
      return false;
    }
    SendControl(ControlMessage{QualityChange{tier}});
    (void)throttle_.SetTier(tier);
    MIRROR_LOG_INFO("Control", "tier -> %s", TierName(tier));
    return true;
  }

  // ==========================================================================
  // Inbound
  // ==========================================================================

  void OnControl(const PeerId& from, const ControlMessage& msg) {
    if (const auto* state = std::get_if<StreamState>(&msg)) {
      std::lock_guard<std::mutex> lock(mutex_);
      remote_stream_enabled_ = state->enabled;
      if (!state->enabled) {
        has_frame_ = false;
        latest_ = DecodedFrame{};
      }
      MIRROR_LOG_INFO("Control", "%s stream %s", from.name.c_str(),
                      state->enabled ? "enabled" : "disabled");
      return;
    }
    const QualityTier tier = std::get<QualityChange>(msg).tier;
    if (!throttle_.SetTier(tier)) {
      MIRROR_LOG_WARN("Control", "%s requested disabled tier '%s'",
                      from.name.c_str(), TierName(tier));
      return;
    }
    MIRROR_LOG_INFO("Control", "%s set tier %s", from.name.c_str(),
                    TierName(tier));
  }

  /** @brief Store a received frame; receiving one implies streaming is on. */
  void OnFrame(DecodedFrame&& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = std::move(frame);
    has_frame_ = true;
    remote_stream_enabled_ = true;
    ++frames_received_;
  }

  /** @brief Forget remote state, e.g. after every peer has gone. */
  void ResetRemote() {
    std::lock_guard<std::mutex> lock(mutex_);
    remote_stream_enabled_ = false;
    has_frame_ = false;
    latest_ = DecodedFrame{};
  }

  // ==========================================================================
  // Query
  // ==========================================================================

  bool RemoteStreamEnabled() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_stream_enabled_;
  }

  bool HasLatestFrame() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return has_frame_;
  }

  /** @brief Copy the most recently received frame; false if none. */
  bool CopyLatestFrame(DecodedFrame& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_frame_) return false;
    out = latest_;
    return true;
  }

  uint64_t FramesReceived() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_received_;
  }

  /** @brief Tier shared by the send throttle and the receive side. */
  QualityTier ActiveTier() const noexcept { return throttle_.Tier(); }

 private:
  void SendControl(const ControlMessage& msg) {
    const std::vector<uint8_t> bytes = WireCodec::EncodeControl(msg);
    auto r = session_.Send(bytes.data(), bytes.size(), Reliability::kReliable);
    if (!r.has_value() && r.get_error() != TransportError::kNotConnected) {
      MIRROR_LOG_WARN("Control", "control send failed (%u)",
                      static_cast<unsigned>(r.get_error()));
    }
  }

  Session& session_;
  FrameThrottle& throttle_;
  bool remote_stream_enabled_ = false;
  bool has_frame_ = false;
  DecodedFrame latest_;
  uint64_t frames_received_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace mirror

#endif  // MIRROR_CONTROL_CHANNEL_HPP_
