/**
 * @file wire_codec.hpp
 * @brief Wire formats for frame envelopes, control records and device info.
 *
 * Frame envelope (binary):
 * +-----------------+-------------------------+------------------+
 * | metadata_len    | metadata (JSON object)  | image bytes      |
 * | u32 little-end. | metadata_len bytes      | rest of message  |
 * +-----------------+-------------------------+------------------+
 *
 * Control record (JSON object):
 *   {"type":"stream_state","enabled":"true"|"false"}
 *   {"type":"quality_change","mode":"performance"|"balanced"|"quality"}
 *
 * Device info record (JSON object):
 *   {"type":"device_info","id":"<uuid>","name":..,"model":..,"systemVersion":..}
 *
 * All decoders are non-throwing: JSON is parsed with exceptions disabled
 * and every field is type-checked before access.
 */

#ifndef MIRROR_WIRE_CODEC_HPP_
#define MIRROR_WIRE_CODEC_HPP_

#include "mirror/platform.hpp"
#include "mirror/quality.hpp"
#include "mirror/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <random>
#include <string>
#include <variant>
#include <vector>

#ifndef MIRROR_WIRE_MAX_RECORD_SIZE
#define MIRROR_WIRE_MAX_RECORD_SIZE 65536U
#endif

namespace mirror {

// ============================================================================
// Data Model
// ============================================================================

/// Capture orientation, EXIF order shifted to 0..7.
enum class Orientation : uint8_t {
  kUp = 0,
  kUpMirrored = 1,
  kDown = 2,
  kDownMirrored = 3,
  kLeftMirrored = 4,
  kRight = 5,
  kRightMirrored = 6,
  kLeft = 7,
};

inline constexpr uint32_t kOrientationCount = 8U;

struct FrameMetadata {
  Orientation orientation = Orientation::kUp;
  double timestamp_s = 0.0;  ///< Capture time, seconds.
  double width = 0.0;        ///< Original (unscaled) width.
  double height = 0.0;       ///< Original (unscaled) height.
  FixedString<31> quality_tier;

  bool operator==(const FrameMetadata& o) const noexcept {
    return orientation == o.orientation && timestamp_s == o.timestamp_s &&
           width == o.width && height == o.height &&
           quality_tier == o.quality_tier;
  }
  bool operator!=(const FrameMetadata& o) const noexcept {
    return !(*this == o);
  }
};

struct DecodedFrame {
  FrameMetadata metadata;
  std::vector<uint8_t> image;
};

struct StreamState {
  bool enabled = false;
};

struct QualityChange {
  QualityTier tier = QualityTier::kBalanced;
};

using ControlMessage = std::variant<StreamState, QualityChange>;

struct DeviceInfo {
  FixedString<36> id;  ///< Canonical UUID text.
  FixedString<63> name;
  FixedString<63> model;
  FixedString<31> system_version;

  /** @brief Build a record with a fresh random (v4) UUID. */
  static DeviceInfo Create(const char* name, const char* model,
                           const char* system_version) {
    DeviceInfo info;
    char uuid[37];
    GenerateUuid(uuid);
    info.id.assign(TruncateToCapacity, uuid);
    info.name.assign(TruncateToCapacity, name);
    info.model.assign(TruncateToCapacity, model);
    info.system_version.assign(TruncateToCapacity, system_version);
    return info;
  }

 private:
  static void GenerateUuid(char* out) {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd() ^
                        SteadyNowNs());
    uint8_t b[16];
    for (uint32_t i = 0; i < 16; i += 8) {
      uint64_t r = gen();
      std::memcpy(b + i, &r, 8);
    }
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant
    (void)std::snprintf(
        out, 37,
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9], b[10],
        b[11], b[12], b[13], b[14], b[15]);
  }
};

/// Result of a discarded inbound message.
struct Discarded {
  WireError reason = WireError::kTruncated;
};

/// Outcome of classifying one inbound payload.
using InboundMessage =
    std::variant<Discarded, ControlMessage, DeviceInfo, DecodedFrame>;

// ============================================================================
// WireCodec
// ============================================================================

class WireCodec {
 public:
  static constexpr uint32_t kLengthPrefixSize = 4;
  static constexpr uint32_t kMaxMetadataSize = 4096;

  // --------------------------------------------------------------------------
  // Frame envelope
  // --------------------------------------------------------------------------

  /**
   * @brief Serialize metadata + image into one envelope.
   *
   * @return kEmptyImage if no image bytes were supplied, kBadMetadata if
   *         the metadata cannot be represented (orientation out of range,
   *         non-finite numbers, empty tier id).
   */
  static expected<std::vector<uint8_t>, WireError> EncodeFrame(
      const FrameMetadata& meta, const uint8_t* image, size_t image_size) {
    using R = expected<std::vector<uint8_t>, WireError>;
    if (image == nullptr || image_size == 0U) {
      return R::error(WireError::kEmptyImage);
    }
    if (!IsValid(meta)) {
      return R::error(WireError::kBadMetadata);
    }
    const std::string meta_text = Dump(MetadataToJson(meta));

    std::vector<uint8_t> out;
    out.resize(kLengthPrefixSize + meta_text.size() + image_size);
    PutU32Le(out.data(), static_cast<uint32_t>(meta_text.size()));
    std::memcpy(out.data() + kLengthPrefixSize, meta_text.data(),
                meta_text.size());
    std::memcpy(out.data() + kLengthPrefixSize + meta_text.size(), image,
                image_size);
    return R::success(std::move(out));
  }

  /**
   * @brief Parse an envelope; metadata and image are returned together or
   *        not at all.
   */
  static expected<DecodedFrame, WireError> DecodeFrame(const uint8_t* data,
                                                       size_t size) {
    using R = expected<DecodedFrame, WireError>;
    if (data == nullptr || size < kLengthPrefixSize) {
      return R::error(WireError::kTruncated);
    }
    const uint32_t meta_len = GetU32Le(data);
    if (meta_len == 0U || meta_len > kMaxMetadataSize ||
        static_cast<uint64_t>(kLengthPrefixSize) + meta_len > size) {
      return R::error(WireError::kBadLength);
    }
    const uint8_t* meta_begin = data + kLengthPrefixSize;
    auto j = nlohmann::json::parse(meta_begin, meta_begin + meta_len, nullptr,
                                   false);
    DecodedFrame frame;
    if (j.is_discarded() || !MetadataFromJson(j, frame.metadata)) {
      return R::error(WireError::kBadMetadata);
    }
    const size_t image_offset = kLengthPrefixSize + meta_len;
    if (image_offset >= size) {
      return R::error(WireError::kEmptyImage);
    }
    frame.image.assign(data + image_offset, data + size);
    return R::success(std::move(frame));
  }

  // --------------------------------------------------------------------------
  // Control records
  // --------------------------------------------------------------------------

  static std::vector<uint8_t> EncodeControl(const ControlMessage& msg) {
    nlohmann::json j;
    if (const auto* s = std::get_if<StreamState>(&msg)) {
      j["type"] = "stream_state";
      j["enabled"] = s->enabled ? "true" : "false";
    } else {
      j["type"] = "quality_change";
      j["mode"] = TierName(std::get<QualityChange>(msg).tier);
    }
    return ToBytes(Dump(j));
  }

  static expected<ControlMessage, WireError> DecodeControl(const uint8_t* data,
                                                           size_t size) {
    auto j = ParseRecord(data, size);
    if (j.is_discarded()) {
      return expected<ControlMessage, WireError>::error(WireError::kNotJson);
    }
    return ControlFromJson(j);
  }

  // --------------------------------------------------------------------------
  // Device info records
  // --------------------------------------------------------------------------

  static std::vector<uint8_t> EncodeDeviceInfo(const DeviceInfo& info) {
    nlohmann::json j;
    j["type"] = "device_info";
    j["id"] = info.id.c_str();
    j["name"] = info.name.c_str();
    j["model"] = info.model.c_str();
    j["systemVersion"] = info.system_version.c_str();
    return ToBytes(Dump(j));
  }

  static expected<DeviceInfo, WireError> DecodeDeviceInfo(const uint8_t* data,
                                                          size_t size) {
    auto j = ParseRecord(data, size);
    if (j.is_discarded()) {
      return expected<DeviceInfo, WireError>::error(WireError::kNotJson);
    }
    return DeviceInfoFromJson(j);
  }

  // --------------------------------------------------------------------------
  // Classification
  // --------------------------------------------------------------------------

  /**
   * @brief Classify an inbound payload by trying each stage in order.
   *
   * Stages: control record, device info record, frame envelope. The first
   * stage that accepts the payload wins; if none does the message is
   * Discarded carrying the reason reported by the last stage.
   */
  static InboundMessage Classify(const uint8_t* data, size_t size) {
    Inbound in{data, size, ParseRecord(data, size), WireError::kTruncated};
    static constexpr StageFn kStages[] = {ControlStage, DeviceInfoStage,
                                          FrameStage};
    InboundMessage out{Discarded{}};
    for (StageFn stage : kStages) {
      if (stage(in, out)) {
        return out;
      }
    }
    return InboundMessage{Discarded{in.last_error}};
  }

 private:
  struct Inbound {
    const uint8_t* data;
    size_t size;
    nlohmann::json record;  ///< Discarded unless the payload is a JSON object.
    WireError last_error;
  };

  using StageFn = bool (*)(Inbound& in, InboundMessage& out);

  static bool ControlStage(Inbound& in, InboundMessage& out) {
    if (in.record.is_discarded()) {
      in.last_error = WireError::kNotJson;
      return false;
    }
    auto r = ControlFromJson(in.record);
    if (!r.has_value()) {
      in.last_error = r.get_error();
      return false;
    }
    out = InboundMessage{r.value()};
    return true;
  }

  static bool DeviceInfoStage(Inbound& in, InboundMessage& out) {
    if (in.record.is_discarded()) {
      return false;
    }
    auto r = DeviceInfoFromJson(in.record);
    if (!r.has_value()) {
      in.last_error = r.get_error();
      return false;
    }
    out = InboundMessage{r.value()};
    return true;
  }

  static bool FrameStage(Inbound& in, InboundMessage& out) {
    if (!in.record.is_discarded()) {
      // A well-formed JSON object is never an envelope.
      return false;
    }
    auto r = DecodeFrame(in.data, in.size);
    if (!r.has_value()) {
      in.last_error = r.get_error();
      return false;
    }
    out = InboundMessage{std::move(r).value()};
    return true;
  }

  // --------------------------------------------------------------------------
  // JSON helpers
  // --------------------------------------------------------------------------

  /// Parse a bounded JSON object; any other input yields a discarded value.
  static nlohmann::json ParseRecord(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0U || size > MIRROR_WIRE_MAX_RECORD_SIZE) {
      return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    size_t i = 0;
    while (i < size && (data[i] == ' ' || data[i] == '\t' || data[i] == '\r' ||
                        data[i] == '\n')) {
      ++i;
    }
    if (i == size || data[i] != '{') {
      return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (!j.is_discarded() && !j.is_object()) {
      return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    return j;
  }

  static std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }

  static std::vector<uint8_t> ToBytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
  }

  static const std::string* FindString(const nlohmann::json& j,
                                       const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return nullptr;
    return &it->get_ref<const std::string&>();
  }

  static bool FindNumber(const nlohmann::json& j, const char* key,
                         double& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return false;
    out = it->get<double>();
    return std::isfinite(out);
  }

  static expected<ControlMessage, WireError> ControlFromJson(
      const nlohmann::json& j) {
    using R = expected<ControlMessage, WireError>;
    const std::string* type = FindString(j, "type");
    if (type == nullptr) {
      return R::error(WireError::kMissingField);
    }
    if (*type == "stream_state") {
      auto it = j.find("enabled");
      if (it == j.end()) return R::error(WireError::kMissingField);
      if (it->is_boolean()) {
        return R::success(ControlMessage{StreamState{it->get<bool>()}});
      }
      if (it->is_string()) {
        const auto& v = it->get_ref<const std::string&>();
        if (v == "true") return R::success(ControlMessage{StreamState{true}});
        if (v == "false") return R::success(ControlMessage{StreamState{false}});
      }
      return R::error(WireError::kMissingField);
    }
    if (*type == "quality_change") {
      const std::string* mode = FindString(j, "mode");
      QualityTier tier{};
      if (mode == nullptr || !ParseTier(mode->c_str(), tier)) {
        return R::error(WireError::kMissingField);
      }
      return R::success(ControlMessage{QualityChange{tier}});
    }
    return R::error(WireError::kUnknownType);
  }

  static expected<DeviceInfo, WireError> DeviceInfoFromJson(
      const nlohmann::json& j) {
    using R = expected<DeviceInfo, WireError>;
    const std::string* type = FindString(j, "type");
    if (type != nullptr && *type != "device_info") {
      return R::error(WireError::kUnknownType);
    }
    const std::string* id = FindString(j, "id");
    const std::string* name = FindString(j, "name");
    const std::string* model = FindString(j, "model");
    const std::string* version = FindString(j, "systemVersion");
    if (id == nullptr || name == nullptr || model == nullptr ||
        version == nullptr) {
      return R::error(WireError::kMissingField);
    }
    DeviceInfo info;
    info.id.assign(TruncateToCapacity, id->c_str(), id->size());
    info.name.assign(TruncateToCapacity, name->c_str(), name->size());
    info.model.assign(TruncateToCapacity, model->c_str(), model->size());
    info.system_version.assign(TruncateToCapacity, version->c_str(),
                               version->size());
    return R::success(info);
  }

  static nlohmann::json MetadataToJson(const FrameMetadata& meta) {
    nlohmann::json j;
    j["orientation"] = static_cast<uint32_t>(meta.orientation);
    j["timestamp"] = meta.timestamp_s;
    j["width"] = meta.width;
    j["height"] = meta.height;
    j["quality"] = meta.quality_tier.c_str();
    return j;
  }

  static bool MetadataFromJson(const nlohmann::json& j, FrameMetadata& meta) {
    if (!j.is_object()) return false;
    auto it = j.find("orientation");
    if (it == j.end() || !it->is_number_integer()) return false;
    const int64_t orientation = it->get<int64_t>();
    if (orientation < 0 || orientation >= kOrientationCount) return false;
    meta.orientation = static_cast<Orientation>(orientation);

    if (!FindNumber(j, "timestamp", meta.timestamp_s) ||
        !FindNumber(j, "width", meta.width) ||
        !FindNumber(j, "height", meta.height)) {
      return false;
    }
    if (meta.width < 0.0 || meta.height < 0.0) return false;

    const std::string* tier = FindString(j, "quality");
    if (tier == nullptr || tier->empty()) return false;
    meta.quality_tier.assign(TruncateToCapacity, tier->c_str(), tier->size());
    return true;
  }

  static bool IsValid(const FrameMetadata& meta) noexcept {
    return static_cast<uint32_t>(meta.orientation) < kOrientationCount &&
           std::isfinite(meta.timestamp_s) && std::isfinite(meta.width) &&
           std::isfinite(meta.height) && meta.width >= 0.0 &&
           meta.height >= 0.0 && !meta.quality_tier.empty();
  }

  static void PutU32Le(uint8_t* p, uint32_t v) noexcept {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
  }

  static uint32_t GetU32Le(const uint8_t* p) noexcept {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
  }
};

}  // namespace mirror

#endif  // MIRROR_WIRE_CODEC_HPP_
