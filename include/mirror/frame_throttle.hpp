/**
 * @file frame_throttle.hpp
 * @brief Per-frame send gate: streaming flag, connection, frame-rate
 *        interval and payload budget, followed by encode and send.
 *
 * Runs inline on the capture thread. The whole decision for one frame is
 * taken under the throttle lock, so a concurrent tier change is observed
 * either entirely before or entirely after a frame.
 */

#ifndef MIRROR_FRAME_THROTTLE_HPP_
#define MIRROR_FRAME_THROTTLE_HPP_

#include "mirror/image_encoder.hpp"
#include "mirror/log.hpp"
#include "mirror/platform.hpp"
#include "mirror/quality.hpp"
#include "mirror/session.hpp"
#include "mirror/wire_codec.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace mirror {

enum class ThrottleOutcome : uint8_t {
  kSent = 0,
  kDroppedDisabled,      ///< Streaming off or active tier disabled.
  kDroppedNotConnected,  ///< Session not Connected or no peers.
  kDroppedInterval,      ///< Faster than the tier frame rate.
  kDroppedOversize,      ///< Envelope larger than max_payload_bytes.
  kDroppedEncodeFailed,  ///< Image or envelope encoding failed.
  kSendFailed,           ///< Transport refused the payload.
};

inline constexpr uint32_t kThrottleOutcomeCount = 7U;

inline const char* ThrottleOutcomeName(ThrottleOutcome o) noexcept {
  switch (o) {
    case ThrottleOutcome::kSent:                return "sent";
    case ThrottleOutcome::kDroppedDisabled:     return "disabled";
    case ThrottleOutcome::kDroppedNotConnected: return "not_connected";
    case ThrottleOutcome::kDroppedInterval:     return "interval";
    case ThrottleOutcome::kDroppedOversize:     return "oversize";
    case ThrottleOutcome::kDroppedEncodeFailed: return "encode_failed";
    case ThrottleOutcome::kSendFailed:          return "send_failed";
  }
  return "";
}

struct ThrottleStats {
  uint64_t outcomes[kThrottleOutcomeCount] = {};
  uint64_t bytes_sent = 0;

  uint64_t Count(ThrottleOutcome o) const noexcept {
    return outcomes[static_cast<uint32_t>(o)];
  }
};

// ============================================================================
// FrameThrottle
// ============================================================================

class FrameThrottle final {
 public:
  FrameThrottle(Session& session, ImageEncoder& encoder,
                const QualityPolicy& policy, QualityTier initial_tier)
      : session_(session), encoder_(encoder), policy_(policy),
        tier_(initial_tier) {}

  FrameThrottle(const FrameThrottle&) = delete;
  FrameThrottle& operator=(const FrameThrottle&) = delete;

  /** @brief Gate, encode and send one captured frame. */
  ThrottleOutcome Process(const RawFrame& frame) {
    return Process(frame, SteadyNowUs());
  }

  /**
   * @brief As Process(frame) with an explicit monotonic time (microseconds).
   *
   * `last_sent` advances only when the frame was actually handed to the
   * transport.
   */
  ThrottleOutcome Process(const RawFrame& frame, uint64_t now_us) {
    std::lock_guard<std::mutex> lock(mutex_);
    ThrottleOutcome outcome = Decide(frame, now_us);
    ++stats_.outcomes[static_cast<uint32_t>(outcome)];
    return outcome;
  }

  void SetStreaming(bool enabled) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    streaming_ = enabled;
  }

  bool IsStreaming() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return streaming_;
  }

  /**
   * @brief Switch the active tier and restart frame pacing.
   * @return false if the tier is disabled; the active tier is unchanged.
   */
  bool SetTier(QualityTier tier) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!policy_.IsEnabled(tier)) {
      return false;
    }
    tier_ = tier;
    has_sent_ = false;
    last_sent_us_ = 0;
    return true;
  }

  QualityTier Tier() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return tier_;
  }

  bool HasSent() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return has_sent_;
  }

  uint64_t LastSentUs() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sent_us_;
  }

  ThrottleStats Stats() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
  }

  const QualityPolicy& Policy() const noexcept { return policy_; }

 private:
  ThrottleOutcome Decide(const RawFrame& frame, uint64_t now_us) {
    if (!streaming_) {
      return ThrottleOutcome::kDroppedDisabled;
    }
    if (!session_.IsConnected()) {
      return ThrottleOutcome::kDroppedNotConnected;
    }
    const TierPolicy* tier = policy_.Find(tier_);
    if (tier == nullptr) {
      return ThrottleOutcome::kDroppedDisabled;
    }
    if (has_sent_ &&
        (now_us < last_sent_us_ ||
         now_us - last_sent_us_ < tier->MinIntervalUs())) {
      return ThrottleOutcome::kDroppedInterval;
    }

    auto enc = encoder_.Encode(frame, tier->encoding, image_);
    if (!enc.has_value()) {
      MIRROR_LOG_DEBUG("Throttle", "encode failed (%u)",
                       static_cast<unsigned>(enc.get_error()));
      return ThrottleOutcome::kDroppedEncodeFailed;
    }

    FrameMetadata meta;
    meta.orientation = frame.orientation;
    meta.timestamp_s = frame.timestamp_s;
    meta.width = static_cast<double>(frame.width);
    meta.height = static_cast<double>(frame.height);
    meta.quality_tier.assign(TruncateToCapacity, TierName(tier->tier));

    auto envelope = WireCodec::EncodeFrame(meta, image_.data(), image_.size());
    if (!envelope.has_value()) {
      MIRROR_LOG_DEBUG("Throttle", "envelope encode failed (%u)",
                       static_cast<unsigned>(envelope.get_error()));
      return ThrottleOutcome::kDroppedEncodeFailed;
    }
    const std::vector<uint8_t>& bytes = envelope.value();
    if (bytes.size() > tier->max_payload_bytes) {
      MIRROR_LOG_DEBUG("Throttle", "frame of %zu bytes exceeds %s budget %u",
                       bytes.size(), TierName(tier->tier),
                       tier->max_payload_bytes);
      return ThrottleOutcome::kDroppedOversize;
    }

    auto sent = session_.Send(bytes.data(), bytes.size(), tier->reliability);
    if (!sent.has_value()) {
      return ThrottleOutcome::kSendFailed;
    }
    has_sent_ = true;
    last_sent_us_ = now_us;
    stats_.bytes_sent += bytes.size();
    return ThrottleOutcome::kSent;
  }

  Session& session_;
  ImageEncoder& encoder_;
  QualityPolicy policy_;
  QualityTier tier_;
  bool streaming_ = true;
  bool has_sent_ = false;
  uint64_t last_sent_us_ = 0;
  std::vector<uint8_t> image_;  ///< Reused encode buffer.
  ThrottleStats stats_;
  mutable std::mutex mutex_;
};

}  // namespace mirror

#endif  // MIRROR_FRAME_THROTTLE_HPP_
