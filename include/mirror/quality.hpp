/**
 * @file quality.hpp
 * @brief Quality tiers and the policy table every streaming module consults.
 *
 * A tier fixes resolution, frame rate, codec, payload budget and the
 * transport reliability used for its frame traffic. Control messages are
 * always sent reliably regardless of tier.
 */

#ifndef MIRROR_QUALITY_HPP_
#define MIRROR_QUALITY_HPP_

#include "mirror/platform.hpp"
#include "mirror/vocabulary.hpp"

#include <cstdint>
#include <cstring>

namespace mirror {

// ============================================================================
// Enumerations
// ============================================================================

enum class QualityTier : uint8_t {
  kPerformance = 0,
  kBalanced = 1,
  kQuality = 2,
};

inline constexpr uint32_t kTierCount = 3U;

/**
 * @brief Transport delivery mode.
 */
enum class Reliability : uint8_t {
  kUnreliable,  // Best-effort, unordered, may be dropped by the transport
  kReliable     // Ordered, retried by the transport
};

enum class CodecKind : uint8_t {
  kLossy,     // JPEG
  kLossless,  // PNG
};

struct EncodingMode {
  CodecKind codec = CodecKind::kLossy;
  float compression = 0.9F;  ///< Lossy quality factor in (0, 1].

  static constexpr EncodingMode Lossy(float q) noexcept {
    return EncodingMode{CodecKind::kLossy, q};
  }
  static constexpr EncodingMode Lossless() noexcept {
    return EncodingMode{CodecKind::kLossless, 1.0F};
  }
};

// ============================================================================
// Tier names
// ============================================================================

/** @brief Wire name of a tier ("performance", "balanced", "quality"). */
inline const char* TierName(QualityTier tier) noexcept {
  switch (tier) {
    case QualityTier::kPerformance: return "performance";
    case QualityTier::kBalanced:    return "balanced";
    case QualityTier::kQuality:     return "quality";
  }
  return "";
}

/** @brief Inverse of TierName(); false for unknown names. */
inline bool ParseTier(const char* name, QualityTier& out) noexcept {
  if (name == nullptr) return false;
  for (uint32_t i = 0; i < kTierCount; ++i) {
    auto tier = static_cast<QualityTier>(i);
    if (std::strcmp(name, TierName(tier)) == 0) {
      out = tier;
      return true;
    }
  }
  return false;
}

// ============================================================================
// TierPolicy
// ============================================================================

struct TierPolicy {
  QualityTier tier = QualityTier::kBalanced;
  bool enabled = true;
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t frame_rate = 30;
  EncodingMode encoding{};
  uint32_t max_payload_bytes = 0;
  Reliability reliability = Reliability::kUnreliable;

  /** @brief Minimum spacing between two sent frames, rounded up to 1 us. */
  uint64_t MinIntervalUs() const noexcept {
    return (frame_rate == 0U) ? 0U
                              : (1000000ULL + frame_rate - 1U) / frame_rate;
  }
};

// ============================================================================
// Default table
// ============================================================================

constexpr TierPolicy kPerformancePolicy{
  QualityTier::kPerformance, true,
  1280, 720,
  60,
  EncodingMode::Lossy(0.95F),
  1000000U,
  Reliability::kUnreliable
};

constexpr TierPolicy kBalancedPolicy{
  QualityTier::kBalanced, true,
  1920, 1080,
  60,
  EncodingMode::Lossy(0.98F),
  4000000U,
  Reliability::kUnreliable
};

constexpr TierPolicy kQualityPolicy{
  QualityTier::kQuality, true,
  3840, 2160,
  30,
  EncodingMode::Lossless(),
  8000000U,
  Reliability::kReliable
};

// ============================================================================
// QualityPolicy
// ============================================================================

/**
 * @brief Lookup table QualityTier -> TierPolicy.
 *
 * Tiers may be disabled by configuration; a disabled tier is not found.
 * The table is immutable once handed to the streaming modules.
 */
class QualityPolicy {
 public:
  QualityPolicy() noexcept
      : table_{kPerformancePolicy, kBalancedPolicy, kQualityPolicy} {}

  /** @return Policy for `tier`, or nullptr if the tier is disabled. */
  const TierPolicy* Find(QualityTier tier) const noexcept {
    const TierPolicy& p = table_[Index(tier)];
    return p.enabled ? &p : nullptr;
  }

  bool IsEnabled(QualityTier tier) const noexcept {
    return table_[Index(tier)].enabled;
  }

  /** @brief Replace the entry for `policy.tier`. */
  void Set(const TierPolicy& policy) noexcept {
    table_[Index(policy.tier)] = policy;
  }

  /** @brief Editable entry, used while building the table from config. */
  TierPolicy& Edit(QualityTier tier) noexcept { return table_[Index(tier)]; }

  uint32_t EnabledCount() const noexcept {
    uint32_t n = 0;
    for (const auto& p : table_) {
      if (p.enabled) ++n;
    }
    return n;
  }

 private:
  static uint32_t Index(QualityTier tier) noexcept {
    auto i = static_cast<uint32_t>(tier);
    MIRROR_ASSERT(i < kTierCount);
    return i;
  }

  TierPolicy table_[kTierCount];
};

}  // namespace mirror

#endif  // MIRROR_QUALITY_HPP_
