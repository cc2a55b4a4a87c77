/**
 * @file test_endpoint.cpp
 * @brief End-to-end tests: two endpoints mirroring over the loopback hub.
 */

#include "mirror/endpoint.hpp"

#include "test_support.hpp"

#include <catch2/catch.hpp>

#include <variant>
#include <vector>

using mirror::ConnectionState;
using mirror::QualityTier;
using mirror::ThrottleOutcome;
using mirror_test::TestImage;

namespace {

class RecordingSink final : public mirror::MediaSink {
 public:
  void Save(const mirror::DecodedFrame& frame, mirror::MediaSaveCompletion done,
            void* ctx) override {
    saved.push_back(frame);
    if (done != nullptr) done(ctx, true);
  }

  std::vector<mirror::DecodedFrame> saved;
};

struct SaveResult {
  int calls = 0;
  bool saved = false;
};

void OnSaved(void* ctx, bool saved) {
  auto* r = static_cast<SaveResult*>(ctx);
  ++r->calls;
  r->saved = saved;
}

mirror::EndpointConfig MakeConfig(const char* name) {
  mirror::EndpointConfig cfg;
  cfg.announce_interval_ms = 0;
  cfg.device = mirror::DeviceInfo::Create(name, "Phone 15", "17.4");
  return cfg;
}

/// Camera and viewer endpoints sharing one loopback hub.
struct Mirror {
  Mirror()
      : camera_link(hub, "camera"),
        viewer_link(hub, "viewer"),
        camera(camera_link, camera_encoder, MakeConfig("camera")),
        viewer(viewer_link, viewer_encoder, MakeConfig("viewer"), &sink) {}

  void Connect() {
    REQUIRE(camera.Start().has_value());
    REQUIRE(viewer.Start().has_value());
    hub.Pump();
    REQUIRE(viewer.session().Invite(camera_link.LocalPeer()).has_value());
    hub.Pump();
    REQUIRE(camera.session().IsConnected());
    REQUIRE(viewer.session().IsConnected());
  }

  mirror::LoopbackHub hub;
  mirror::LoopbackTransport camera_link;
  mirror::LoopbackTransport viewer_link;
  mirror::CodecImageEncoder camera_encoder;
  mirror::CodecImageEncoder viewer_encoder;
  RecordingSink sink;
  mirror::Endpoint camera;
  mirror::Endpoint viewer;
};

}  // namespace

// ============================================================================
// Discovery and connection
// ============================================================================

TEST_CASE("endpoint - Endpoints discover each other", "[Endpoint]") {
  Mirror m;
  REQUIRE(m.camera.Start().has_value());
  REQUIRE(m.viewer.Start().has_value());
  m.hub.Pump();

  auto snap = m.viewer.session().Snapshot();
  REQUIRE(snap.available.size() == 1U);
  CHECK(snap.available[0] == m.camera_link.LocalPeer());
  CHECK(snap.available[0].name == "camera");
}

TEST_CASE("endpoint - Connecting exchanges device info", "[Endpoint]") {
  Mirror m;
  m.Connect();

  mirror::DeviceInfo remote;
  REQUIRE(m.viewer.RemoteDevice(remote));
  CHECK(remote.id == m.camera.device().id);
  CHECK(remote.name == "camera");
  REQUIRE(m.camera.RemoteDevice(remote));
  CHECK(remote.name == "viewer");
  CHECK(m.viewer.Stats().device_infos >= 1U);
}

// ============================================================================
// Frames
// ============================================================================

TEST_CASE("endpoint - Captured frame reaches the viewer", "[Endpoint]") {
  Mirror m;
  m.Connect();
  TestImage img(32, 24);
  img.frame.orientation = mirror::Orientation::kRight;
  img.frame.timestamp_s = 3.25;

  CHECK(m.camera.SubmitFrame(img.frame, 0) == ThrottleOutcome::kSent);
  m.hub.Pump();

  CHECK(m.viewer.Stats().frames == 1U);
  CHECK(m.viewer.control().RemoteStreamEnabled());
  mirror::DecodedFrame frame;
  REQUIRE(m.viewer.control().CopyLatestFrame(frame));
  CHECK(frame.metadata.orientation == mirror::Orientation::kRight);
  CHECK(frame.metadata.timestamp_s == 3.25);
  CHECK(frame.metadata.width == 32.0);
  CHECK(frame.metadata.height == 24.0);
  CHECK(frame.metadata.quality_tier == "balanced");
  REQUIRE(frame.image.size() > 2U);
  CHECK(frame.image[0] == 0xFF);
  CHECK(frame.image[1] == 0xD8);
}

TEST_CASE("endpoint - Frames are dropped before connecting", "[Endpoint]") {
  Mirror m;
  TestImage img(8, 8);
  CHECK(m.camera.SubmitFrame(img.frame, 0) ==
        ThrottleOutcome::kDroppedNotConnected);
}

// ============================================================================
// Control
// ============================================================================

TEST_CASE("endpoint - Viewer tier request switches the camera",
          "[Endpoint]") {
  Mirror m;
  m.Connect();

  REQUIRE(m.viewer.control().RequestTier(QualityTier::kQuality));
  m.hub.Pump();

  CHECK(m.camera.control().ActiveTier() == QualityTier::kQuality);
  CHECK(m.viewer.control().ActiveTier() == QualityTier::kQuality);

  TestImage img(16, 16);
  REQUIRE(m.camera.SubmitFrame(img.frame, 0) == ThrottleOutcome::kSent);
  m.hub.Pump();
  mirror::DecodedFrame frame;
  REQUIRE(m.viewer.control().CopyLatestFrame(frame));
  CHECK(frame.metadata.quality_tier == "quality");
  REQUIRE(frame.image.size() > 8U);
  CHECK(frame.image[1] == 'P');
}

TEST_CASE("endpoint - Stopping the camera stream clears the viewer",
          "[Endpoint]") {
  Mirror m;
  m.Connect();
  TestImage img(8, 8);
  REQUIRE(m.camera.SubmitFrame(img.frame, 0) == ThrottleOutcome::kSent);
  m.hub.Pump();
  REQUIRE(m.viewer.control().HasLatestFrame());

  m.camera.control().SetLocalStreaming(false);
  m.hub.Pump();

  CHECK_FALSE(m.viewer.control().RemoteStreamEnabled());
  CHECK_FALSE(m.viewer.control().HasLatestFrame());
  CHECK(m.camera.SubmitFrame(img.frame, 100000) ==
        ThrottleOutcome::kDroppedDisabled);
  CHECK(m.viewer.Stats().controls == 1U);
}

// ============================================================================
// Saving / teardown
// ============================================================================

TEST_CASE("endpoint - SaveLatestFrame hands the frame to the sink",
          "[Endpoint]") {
  Mirror m;
  m.Connect();
  SaveResult result;

  m.viewer.SaveLatestFrame(OnSaved, &result);
  CHECK(result.calls == 1);
  CHECK_FALSE(result.saved);
  CHECK(m.sink.saved.empty());

  TestImage img(8, 8);
  REQUIRE(m.camera.SubmitFrame(img.frame, 0) == ThrottleOutcome::kSent);
  m.hub.Pump();

  m.viewer.SaveLatestFrame(OnSaved, &result);
  CHECK(result.calls == 2);
  CHECK(result.saved);
  REQUIRE(m.sink.saved.size() == 1U);
  CHECK(m.sink.saved[0].metadata.width == 8.0);
}

TEST_CASE("endpoint - SaveLatestFrame without a sink fails", "[Endpoint]") {
  Mirror m;
  SaveResult result;
  m.camera.SaveLatestFrame(OnSaved, &result);
  CHECK(result.calls == 1);
  CHECK_FALSE(result.saved);
}

TEST_CASE("endpoint - Disconnect resets both sides", "[Endpoint]") {
  Mirror m;
  m.Connect();
  TestImage img(8, 8);
  REQUIRE(m.camera.SubmitFrame(img.frame, 0) == ThrottleOutcome::kSent);
  m.hub.Pump();

  m.viewer.session().Disconnect();
  m.hub.Pump();

  CHECK(m.viewer.session().State() == ConnectionState::kDisconnected);
  CHECK(m.camera.session().State() == ConnectionState::kDisconnected);
  CHECK_FALSE(m.viewer.control().HasLatestFrame());
  CHECK_FALSE(m.viewer.control().RemoteStreamEnabled());

  // The camera re-advertised, so the viewer can dial again.
  REQUIRE(m.viewer.session().Invite(m.camera_link.LocalPeer()).has_value());
  m.hub.Pump();
  CHECK(m.viewer.session().IsConnected());
  CHECK(m.camera.session().IsConnected());
}

TEST_CASE("endpoint - Garbage payloads are counted as discarded",
          "[Endpoint]") {
  Mirror m;
  m.Connect();
  const uint8_t junk[6] = {0, 0, 0, 0, 1, 2};
  const mirror::PeerId viewer = m.viewer_link.LocalPeer();
  REQUIRE(m.camera_link
              .Send(junk, sizeof(junk), &viewer, 1,
                    mirror::Reliability::kReliable)
              .has_value());
  m.hub.Pump();
  CHECK(m.viewer.Stats().discarded == 1U);
  CHECK(m.viewer.Stats().frames == 0U);
}

TEST_CASE("endpoint - Discarded payloads leave receive state untouched",
          "[Endpoint]") {
  Mirror m;
  m.Connect();
  REQUIRE(m.viewer.control().RequestTier(QualityTier::kPerformance));
  m.hub.Pump();

  TestImage img(16, 16);
  img.frame.timestamp_s = 7.5;
  REQUIRE(m.camera.SubmitFrame(img.frame, 0) == ThrottleOutcome::kSent);
  m.hub.Pump();

  mirror::DecodedFrame before;
  REQUIRE(m.viewer.control().CopyLatestFrame(before));
  REQUIRE(m.viewer.control().RemoteStreamEnabled());
  const auto stats_before = m.viewer.Stats();

  // Build the hostile set from a real envelope.
  const uint8_t image[4] = {0xFF, 0xD8, 0xFF, 0xD9};
  auto valid = mirror::WireCodec::EncodeFrame(before.metadata, image,
                                              sizeof(image));
  REQUIRE(valid.has_value());

  const mirror::PeerId viewer = m.viewer_link.LocalPeer();
  uint64_t sent = 0;
  for (const auto& payload : mirror_test::HostilePayloads(valid.value())) {
    if (payload.empty()) continue;
    auto kind = mirror::WireCodec::Classify(payload.data(), payload.size());
    if (!std::holds_alternative<mirror::Discarded>(kind)) continue;

    REQUIRE(m.camera_link
                .Send(payload.data(), payload.size(), &viewer, 1,
                      mirror::Reliability::kReliable)
                .has_value());
    m.hub.Pump();
    ++sent;

    mirror::DecodedFrame now;
    REQUIRE(m.viewer.control().CopyLatestFrame(now));
    CHECK(now.metadata == before.metadata);
    CHECK(now.image == before.image);
    CHECK(m.viewer.control().RemoteStreamEnabled());
    CHECK(m.viewer.control().ActiveTier() == QualityTier::kPerformance);
    CHECK(m.camera.control().ActiveTier() == QualityTier::kPerformance);
  }

  REQUIRE(sent > 500U);
  const auto stats = m.viewer.Stats();
  CHECK(stats.discarded == stats_before.discarded + sent);
  CHECK(stats.frames == stats_before.frames);
  CHECK(stats.controls == stats_before.controls);
  CHECK(stats.device_infos == stats_before.device_infos);
  CHECK(m.viewer.session().IsConnected());
}

TEST_CASE("endpoint - Config from loaded settings", "[Endpoint]") {
  mirror::MirrorConfig cfg;
  cfg.default_tier = QualityTier::kPerformance;
  cfg.announce_interval_ms = 250;
  cfg.session.max_retries = 5;
  auto info = mirror::DeviceInfo::Create("d", "m", "1");

  auto ep = mirror::MakeEndpointConfig(cfg, info);

  CHECK(ep.default_tier == QualityTier::kPerformance);
  CHECK(ep.announce_interval_ms == 250U);
  CHECK(ep.session.max_retries == 5U);
  CHECK(ep.device.id == info.id);
}
