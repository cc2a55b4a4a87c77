/**
 * @file test_support.hpp
 * @brief Recording transport and canned encoders shared by the tests.
 */

#ifndef MIRROR_TESTS_TEST_SUPPORT_HPP_
#define MIRROR_TESTS_TEST_SUPPORT_HPP_

#include "mirror/image_encoder.hpp"
#include "mirror/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace mirror_test {

// ============================================================================
// MockTransport
// ============================================================================

/**
 * @brief TransportAdapter that records every call as a short string
 *        ("advertise", "stop_browse", "invite:2", "send:3:R", ...).
 *
 * Nothing is delivered; tests drive the listener directly.
 */
class MockTransport final : public mirror::TransportAdapter {
 public:
  MockTransport() : local_(100, "local") {}

  void SetListener(mirror::TransportListener* listener) override {
    listener_ = listener;
  }

  const mirror::PeerId& LocalPeer() const noexcept override { return local_; }

  mirror::expected<void, mirror::TransportError> Advertise(
      const char* service) override {
    calls.push_back("advertise");
    last_service = service;
    if (fail_advertise) {
      return mirror::expected<void, mirror::TransportError>::error(
          mirror::TransportError::kAdvertiseFailed);
    }
    return mirror::expected<void, mirror::TransportError>::success();
  }

  void StopAdvertising() override { calls.push_back("stop_advertise"); }

  mirror::expected<void, mirror::TransportError> Browse(
      const char* service) override {
    calls.push_back("browse");
    last_service = service;
    if (fail_browse) {
      return mirror::expected<void, mirror::TransportError>::error(
          mirror::TransportError::kBrowseFailed);
    }
    return mirror::expected<void, mirror::TransportError>::success();
  }

  void StopBrowsing() override { calls.push_back("stop_browse"); }

  mirror::expected<void, mirror::TransportError> Invite(
      const mirror::PeerId& peer, uint32_t timeout_s) override {
    calls.push_back("invite:" + std::to_string(peer.value));
    last_invite_timeout_s = timeout_s;
    if (fail_invite) {
      return mirror::expected<void, mirror::TransportError>::error(
          mirror::TransportError::kInviteFailed);
    }
    return mirror::expected<void, mirror::TransportError>::success();
  }

  mirror::expected<void, mirror::TransportError> Send(
      const uint8_t* data, size_t size, const mirror::PeerId* peers,
      uint32_t peer_count, mirror::Reliability reliability) override {
    calls.push_back("send:" + std::to_string(peer_count) + ":" +
                    (reliability == mirror::Reliability::kReliable ? "R"
                                                                   : "U"));
    sent.emplace_back(data, data + size);
    sent_reliability.push_back(reliability);
    (void)peers;
    if (fail_send) {
      return mirror::expected<void, mirror::TransportError>::error(
          mirror::TransportError::kSendFailed);
    }
    return mirror::expected<void, mirror::TransportError>::success();
  }

  void ResetSession() override { calls.push_back("reset"); }
  void DisconnectAll() override { calls.push_back("disconnect_all"); }

  /** @brief Count of calls equal to `name`. */
  uint32_t CountOf(const std::string& name) const {
    uint32_t n = 0;
    for (const auto& c : calls) {
      if (c == name) ++n;
    }
    return n;
  }

  /** @brief Index of the first call equal to `name` at or after `from`. */
  int32_t IndexOf(const std::string& name, size_t from = 0) const {
    for (size_t i = from; i < calls.size(); ++i) {
      if (calls[i] == name) return static_cast<int32_t>(i);
    }
    return -1;
  }

  mirror::TransportListener* listener() const noexcept { return listener_; }

  std::vector<std::string> calls;
  std::vector<std::vector<uint8_t>> sent;
  std::vector<mirror::Reliability> sent_reliability;
  std::string last_service;
  uint32_t last_invite_timeout_s = 0;
  bool fail_advertise = false;
  bool fail_browse = false;
  bool fail_invite = false;
  bool fail_send = false;

 private:
  mirror::PeerId local_;
  mirror::TransportListener* listener_ = nullptr;
};

// ============================================================================
// FixedSizeEncoder
// ============================================================================

/**
 * @brief Produces `size` bytes of filler for any frame, or fails on demand.
 */
class FixedSizeEncoder final : public mirror::ImageEncoder {
 public:
  explicit FixedSizeEncoder(size_t size) noexcept : size(size) {}

  mirror::expected<void, mirror::EncodeError> Encode(
      const mirror::RawFrame& frame, const mirror::EncodingMode& mode,
      std::vector<uint8_t>& out) override {
    (void)frame;
    last_mode = mode;
    ++calls;
    if (fail) {
      return mirror::expected<void, mirror::EncodeError>::error(
          mirror::EncodeError::kCodecFailed);
    }
    out.assign(size, 0xAB);
    return mirror::expected<void, mirror::EncodeError>::success();
  }

  size_t size;
  bool fail = false;
  uint32_t calls = 0;
  mirror::EncodingMode last_mode{};
};

// ============================================================================
// Frames
// ============================================================================

/** @brief Solid-colour BGRA image with its RawFrame view. */
struct TestImage {
  TestImage(uint32_t w, uint32_t h, uint8_t b = 40, uint8_t g = 120,
            uint8_t r = 200)
      : pixels(static_cast<size_t>(w) * h * 4U) {
    for (size_t i = 0; i < pixels.size(); i += 4) {
      pixels[i + 0] = b;
      pixels[i + 1] = g;
      pixels[i + 2] = r;
      pixels[i + 3] = 0xFF;
    }
    frame.pixels = pixels.data();
    frame.width = w;
    frame.height = h;
    frame.stride = w * 4U;
    frame.format = mirror::PixelFormat::kBgra32;
  }

  std::vector<uint8_t> pixels;
  mirror::RawFrame frame;
};

// ============================================================================
// Hostile payloads
// ============================================================================

/**
 * @brief Inputs a receiver must survive: every prefix of `envelope`,
 *        single-byte corruptions of its length prefix and metadata,
 *        seeded random byte strings and JSON records with wrong field types.
 *
 * `envelope` must be a valid frame envelope.
 */
inline std::vector<std::vector<uint8_t>> HostilePayloads(
    const std::vector<uint8_t>& envelope) {
  std::vector<std::vector<uint8_t>> out;

  for (size_t n = 0; n < envelope.size(); ++n) {
    out.emplace_back(envelope.begin(),
                     envelope.begin() + static_cast<std::ptrdiff_t>(n));
  }

  const uint32_t meta_len = static_cast<uint32_t>(envelope[0]) |
                            (static_cast<uint32_t>(envelope[1]) << 8) |
                            (static_cast<uint32_t>(envelope[2]) << 16) |
                            (static_cast<uint32_t>(envelope[3]) << 24);
  const uint8_t kSubstitutes[] = {0x00, 0x01, 0x7F, 0xFF, '"', '}', 'x'};
  const size_t meta_end = 4U + meta_len;
  for (size_t i = 0; i < meta_end && i < envelope.size(); ++i) {
    for (uint8_t v : kSubstitutes) {
      if (envelope[i] == v) continue;
      std::vector<uint8_t> bad = envelope;
      bad[i] = v;
      out.push_back(std::move(bad));
    }
  }

  std::mt19937 rng(0x6D697272U);
  std::uniform_int_distribution<int> byte(0, 255);
  std::uniform_int_distribution<int> length(1, 96);
  for (int i = 0; i < 300; ++i) {
    std::vector<uint8_t> junk(static_cast<size_t>(length(rng)));
    for (auto& b : junk) b = static_cast<uint8_t>(byte(rng));
    if ((i % 3) == 0) junk[0] = '{';
    out.push_back(std::move(junk));
  }

  const char* kWrongTypes[] = {
      R"({"type":5})",
      R"({"type":["stream_state"],"enabled":"true"})",
      R"({"type":"stream_state"})",
      R"({"type":"stream_state","enabled":1})",
      R"({"type":"stream_state","enabled":null})",
      R"({"type":"stream_state","enabled":"yes"})",
      R"({"type":"stream_state","enabled":{"value":false}})",
      R"({"type":"quality_change","mode":3})",
      R"({"type":"quality_change","mode":"ultra"})",
      R"({"type":"quality_change","mode":["quality"]})",
      R"({"type":"quality_change"})",
      R"({"type":"device_info","id":1,"name":"n","model":"m","systemVersion":"1"})",
      R"({"id":"a","name":["n"],"model":"m","systemVersion":"1"})",
      R"({"id":"a","name":"n","model":"m"})",
      R"({"orientation":0,"timestamp":1,"width":4,"height":2,"quality":"balanced"})",
      R"([{"type":"stream_state","enabled":"false"}])",
      R"("quality_change")",
      "42",
      "null",
      "{",
  };
  for (const char* text : kWrongTypes) {
    out.emplace_back(text, text + std::char_traits<char>::length(text));
  }

  const char* kBadMetadata[] = {
      R"({"orientation":"0","timestamp":1,"width":4,"height":2,"quality":"balanced"})",
      R"({"orientation":1.5,"timestamp":1,"width":4,"height":2,"quality":"balanced"})",
      R"({"orientation":8,"timestamp":1,"width":4,"height":2,"quality":"balanced"})",
      R"({"orientation":-1,"timestamp":1,"width":4,"height":2,"quality":"balanced"})",
      R"({"orientation":0,"timestamp":null,"width":4,"height":2,"quality":"balanced"})",
      R"({"orientation":0,"timestamp":1,"width":"4","height":2,"quality":"balanced"})",
      R"({"orientation":0,"timestamp":1,"width":-4,"height":2,"quality":"balanced"})",
      R"({"orientation":0,"timestamp":1,"width":4,"height":2,"quality":3})",
      R"({"orientation":0,"timestamp":1,"width":4,"height":2,"quality":""})",
      R"([0,1,4,2,"balanced"])",
  };
  for (const char* text : kBadMetadata) {
    const uint32_t len =
        static_cast<uint32_t>(std::char_traits<char>::length(text));
    std::vector<uint8_t> env = {static_cast<uint8_t>(len),
                                static_cast<uint8_t>(len >> 8), 0, 0};
    env.insert(env.end(), text, text + len);
    env.push_back(0xD8);
    out.push_back(std::move(env));
  }
  return out;
}

inline const mirror::PeerId kPeerA{1, "peer-a"};
inline const mirror::PeerId kPeerB{2, "peer-b"};
inline const mirror::PeerId kPeerC{3, "peer-c"};

}  // namespace mirror_test

#endif  // MIRROR_TESTS_TEST_SUPPORT_HPP_
