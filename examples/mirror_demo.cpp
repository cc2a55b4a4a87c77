/**
 * @file mirror_demo.cpp
 * @brief Camera and viewer endpoints mirroring over the loopback hub.
 *
 * Demonstrates:
 *   - Loading settings from a config file (optional argv[1])
 *   - Discovery, invitation and device-info exchange
 *   - Throttled JPEG/PNG frame streaming with synthetic BGRA frames
 *   - Viewer-driven tier switch and remote stream toggle
 *   - Saving the latest received frame through a MediaSink
 */

#include "mirror/config.hpp"
#include "mirror/endpoint.hpp"
#include "mirror/image_encoder.hpp"
#include "mirror/log.hpp"
#include "mirror/transport.hpp"

#include <cstdint>
#include <cstdio>
#include <vector>

namespace {

// -- MediaSink writing the encoded image to disk ----------------------------

class FileMediaSink final : public mirror::MediaSink {
 public:
  explicit FileMediaSink(const char* dir) : dir_(dir) {}

  void Save(const mirror::DecodedFrame& frame, mirror::MediaSaveCompletion done,
            void* ctx) override {
    const bool png = frame.metadata.quality_tier == "quality";
    char path[256];
    (void)std::snprintf(path, sizeof(path), "%s/mirror_%u.%s", dir_,
                        static_cast<unsigned>(++count_), png ? "png" : "jpg");
    FILE* f = std::fopen(path, "wb");
    bool ok = false;
    if (f != nullptr) {
      ok = std::fwrite(frame.image.data(), 1, frame.image.size(), f) ==
           frame.image.size();
      ok = (std::fclose(f) == 0) && ok;
    }
    if (ok) {
      MIRROR_LOG_INFO("demo", "saved %zu bytes to %s", frame.image.size(),
                      path);
    } else {
      MIRROR_LOG_WARN("demo", "could not write %s", path);
    }
    if (done != nullptr) done(ctx, ok);
  }

 private:
  const char* dir_;
  uint32_t count_ = 0;
};

// -- Synthetic camera --------------------------------------------------------

void PaintFrame(std::vector<uint8_t>& pixels, uint32_t w, uint32_t h,
                uint32_t tick) {
  for (uint32_t y = 0; y < h; ++y) {
    for (uint32_t x = 0; x < w; ++x) {
      uint8_t* p = &pixels[(static_cast<size_t>(y) * w + x) * 4U];
      p[0] = static_cast<uint8_t>(x + tick * 4U);
      p[1] = static_cast<uint8_t>(y * 2U);
      p[2] = static_cast<uint8_t>((x ^ y) + tick);
      p[3] = 0xFF;
    }
  }
}

void OnSaved(void* ctx, bool saved) {
  *static_cast<bool*>(ctx) = saved;
}

}  // namespace

// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
  mirror::MirrorConfig settings;
  if (argc > 1) {
    mirror::MultiConfig file;
    auto loaded = file.LoadFile(argv[1]);
    if (!loaded.has_value()) {
      std::fprintf(stderr, "cannot load %s (%u)\n", argv[1],
                   static_cast<unsigned>(loaded.get_error()));
      return 1;
    }
    auto parsed = mirror::LoadMirrorConfig(file);
    if (!parsed.has_value()) {
      std::fprintf(stderr, "invalid settings in %s\n", argv[1]);
      return 1;
    }
    settings = parsed.value();
  }
  mirror::log::Init(settings.log_level);

  mirror::LoopbackHub hub;
  mirror::LoopbackTransport camera_link(hub, "camera");
  mirror::LoopbackTransport viewer_link(hub, "viewer");
  mirror::CodecImageEncoder camera_encoder;
  mirror::CodecImageEncoder viewer_encoder;
  FileMediaSink sink("/tmp");

  mirror::Endpoint camera(
      camera_link, camera_encoder,
      mirror::MakeEndpointConfig(
          settings, mirror::DeviceInfo::Create("camera", "Demo Cam", "1.0")));
  mirror::Endpoint viewer(
      viewer_link, viewer_encoder,
      mirror::MakeEndpointConfig(
          settings, mirror::DeviceInfo::Create(settings.display_name.c_str(),
                                               "Demo Viewer", "1.0")),
      &sink);

  if (!camera.Start(mirror::kRoleAdvertiser).has_value() ||
      !viewer.Start(mirror::kRoleBrowser).has_value()) {
    MIRROR_LOG_ERROR("demo", "could not start discovery");
    return 1;
  }
  hub.Pump();

  auto roster = viewer.session().Snapshot();
  if (roster.available.empty()) {
    MIRROR_LOG_ERROR("demo", "no camera found");
    return 1;
  }
  if (!viewer.session().Invite(roster.available[0]).has_value()) {
    MIRROR_LOG_ERROR("demo", "invite refused");
    return 1;
  }
  hub.Pump();
  MIRROR_LOG_INFO("demo", "camera %s, viewer %s", camera.session().StateName(),
                  viewer.session().StateName());

  mirror::DeviceInfo remote;
  if (viewer.RemoteDevice(remote)) {
    MIRROR_LOG_INFO("demo", "viewer sees %s (%s, %s)", remote.name.c_str(),
                    remote.model.c_str(), remote.id.c_str());
  }

  // 2 seconds of capture at 100 Hz on a simulated clock.
  const uint32_t kWidth = 160;
  const uint32_t kHeight = 120;
  std::vector<uint8_t> pixels(static_cast<size_t>(kWidth) * kHeight * 4U);
  mirror::RawFrame frame;
  frame.pixels = pixels.data();
  frame.width = kWidth;
  frame.height = kHeight;
  frame.stride = kWidth * 4U;
  frame.format = mirror::PixelFormat::kBgra32;

  for (uint32_t tick = 0; tick < 200; ++tick) {
    const uint64_t now_us = static_cast<uint64_t>(tick) * 10000U;
    switch (tick) {
      case 50:  (void)viewer.control().RequestTier(mirror::QualityTier::kPerformance); break;
      case 100: (void)viewer.control().RequestTier(mirror::QualityTier::kQuality); break;
      case 140: camera.control().SetLocalStreaming(false); break;
      case 160: camera.control().SetLocalStreaming(true); break;
      default: break;
    }
    PaintFrame(pixels, kWidth, kHeight, tick);
    frame.timestamp_s = static_cast<double>(now_us) / 1e6;
    (void)camera.SubmitFrame(frame, now_us);
    hub.Pump();
  }

  bool saved = false;
  viewer.SaveLatestFrame(OnSaved, &saved);

  // -- Statistics --------------------------------------------------------------

  const mirror::ThrottleStats sent = camera.throttle().Stats();
  std::printf("\n--- camera (%s tier) ---\n",
              mirror::TierName(camera.control().ActiveTier()));
  for (uint32_t i = 0; i < mirror::kThrottleOutcomeCount; ++i) {
    auto o = static_cast<mirror::ThrottleOutcome>(i);
    std::printf("  %-14s %llu\n", mirror::ThrottleOutcomeName(o),
                static_cast<unsigned long long>(sent.Count(o)));
  }
  std::printf("  bytes sent     %llu\n",
              static_cast<unsigned long long>(sent.bytes_sent));

  const mirror::ReceiveStats recv = viewer.Stats();
  std::printf("--- viewer ---\n");
  std::printf("  frames         %llu\n",
              static_cast<unsigned long long>(recv.frames));
  std::printf("  controls       %llu\n",
              static_cast<unsigned long long>(recv.controls));
  std::printf("  device infos   %llu\n",
              static_cast<unsigned long long>(recv.device_infos));
  std::printf("  discarded      %llu\n",
              static_cast<unsigned long long>(recv.discarded));
  std::printf("  remote stream  %s\n",
              viewer.control().RemoteStreamEnabled() ? "on" : "off");
  std::printf("  saved latest   %s\n", saved ? "yes" : "no");

  viewer.Stop();
  camera.Stop();
  hub.Pump();
  mirror::log::Shutdown();
  return 0;
}
