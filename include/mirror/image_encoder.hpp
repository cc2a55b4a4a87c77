/**
 * @file image_encoder.hpp
 * @brief Still-image encoders for captured frames (JPEG via libjpeg, PNG
 *        via libpng).
 *
 * Frames are encoded at native resolution. libjpeg and libpng report
 * fatal errors through longjmp; both encoders install a jump target and
 * turn it into an EncodeError.
 */

#ifndef MIRROR_IMAGE_ENCODER_HPP_
#define MIRROR_IMAGE_ENCODER_HPP_

#include "mirror/log.hpp"
#include "mirror/quality.hpp"
#include "mirror/vocabulary.hpp"
#include "mirror/wire_codec.hpp"

#include <csetjmp>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <jpeglib.h>
#include <png.h>

namespace mirror {

// ============================================================================
// RawFrame
// ============================================================================

enum class PixelFormat : uint8_t {
  kRgb24,   ///< 3 bytes per pixel, R G B.
  kBgra32,  ///< 4 bytes per pixel, B G R A (typical camera buffer).
};

inline constexpr uint32_t BytesPerPixel(PixelFormat fmt) noexcept {
  return (fmt == PixelFormat::kRgb24) ? 3U : 4U;
}

/**
 * @brief A captured frame as delivered by the camera pipeline.
 *
 * Non-owning: `pixels` must stay valid for the duration of Encode().
 */
struct RawFrame {
  const uint8_t* pixels = nullptr;
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t stride = 0;  ///< Bytes per row; >= width * BytesPerPixel().
  PixelFormat format = PixelFormat::kBgra32;
  double timestamp_s = 0.0;
  Orientation orientation = Orientation::kUp;

  bool IsValid() const noexcept {
    return pixels != nullptr && width > 0U && height > 0U &&
           stride >= width * BytesPerPixel(format);
  }
};

// ============================================================================
// ImageEncoder
// ============================================================================

class ImageEncoder {
 public:
  virtual ~ImageEncoder() = default;

  /**
   * @brief Encode `frame` with `mode`, replacing the contents of `out`.
   * @return kInvalidFrame for an unusable frame, kUnsupportedFormat when
   *         the encoder does not implement `mode.codec`, kCodecFailed if
   *         the codec library reported an error.
   */
  virtual expected<void, EncodeError> Encode(const RawFrame& frame,
                                             const EncodingMode& mode,
                                             std::vector<uint8_t>& out) = 0;
};

// ============================================================================
// JpegImageEncoder
// ============================================================================

class JpegImageEncoder final : public ImageEncoder {
 public:
  expected<void, EncodeError> Encode(const RawFrame& frame,
                                     const EncodingMode& mode,
                                     std::vector<uint8_t>& out) override {
    using R = expected<void, EncodeError>;
    if (mode.codec != CodecKind::kLossy) {
      return R::error(EncodeError::kUnsupportedFormat);
    }
    if (!frame.IsValid() || !(mode.compression > 0.0F) ||
        mode.compression > 1.0F) {
      return R::error(EncodeError::kInvalidFrame);
    }
    out.clear();

    std::vector<uint8_t> row(static_cast<size_t>(frame.width) * 3U);
    unsigned char* jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;  // NOLINT(runtime/int) libjpeg API

    jpeg_compress_struct cinfo;
    ErrorManager jerr;
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = OnError;
    jerr.pub.output_message = OnMessage;
    if (setjmp(jerr.jump) != 0) {
      jpeg_destroy_compress(&cinfo);
      std::free(jpeg_buf);
      return R::error(EncodeError::kCodecFailed);
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &jpeg_buf, &jpeg_size);
    cinfo.image_width = frame.width;
    cinfo.image_height = frame.height;
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, QualityPercent(mode.compression), TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    while (cinfo.next_scanline < cinfo.image_height) {
      const uint8_t* src =
          frame.pixels + static_cast<size_t>(cinfo.next_scanline) * frame.stride;
      ToRgb(src, frame.width, frame.format, row.data());
      JSAMPROW rows[1] = {row.data()};
      (void)jpeg_write_scanlines(&cinfo, rows, 1);
    }
    jpeg_finish_compress(&cinfo);
    out.assign(jpeg_buf, jpeg_buf + jpeg_size);
    jpeg_destroy_compress(&cinfo);
    std::free(jpeg_buf);
    return R::success();
  }

  /** @brief Map a (0, 1] quality factor to libjpeg's 1..100 scale. */
  static int QualityPercent(float q) noexcept {
    int pct = static_cast<int>(q * 100.0F + 0.5F);
    if (pct < 1) pct = 1;
    if (pct > 100) pct = 100;
    return pct;
  }

 private:
  struct ErrorManager {
    jpeg_error_mgr pub;  // must be first
    std::jmp_buf jump;
  };

  static void OnError(j_common_ptr cinfo) {
    char msg[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, msg);
    MIRROR_LOG_WARN("ImageEncoder", "libjpeg: %s", msg);
    auto* err = reinterpret_cast<ErrorManager*>(cinfo->err);
    std::longjmp(err->jump, 1);
  }

  static void OnMessage(j_common_ptr /*cinfo*/) {}

  static void ToRgb(const uint8_t* src, uint32_t width, PixelFormat fmt,
                    uint8_t* dst) noexcept {
    if (fmt == PixelFormat::kRgb24) {
      std::memcpy(dst, src, static_cast<size_t>(width) * 3U);
      return;
    }
    for (uint32_t x = 0; x < width; ++x) {
      dst[0] = src[2];
      dst[1] = src[1];
      dst[2] = src[0];
      src += 4;
      dst += 3;
    }
  }
};

// ============================================================================
// PngImageEncoder
// ============================================================================

class PngImageEncoder final : public ImageEncoder {
 public:
  expected<void, EncodeError> Encode(const RawFrame& frame,
                                     const EncodingMode& mode,
                                     std::vector<uint8_t>& out) override {
    using R = expected<void, EncodeError>;
    if (mode.codec != CodecKind::kLossless) {
      return R::error(EncodeError::kUnsupportedFormat);
    }
    if (!frame.IsValid()) {
      return R::error(EncodeError::kInvalidFrame);
    }
    out.clear();

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr,
                                              OnError, OnWarning);
    if (png == nullptr) {
      return R::error(EncodeError::kCodecFailed);
    }
    png_infop info = png_create_info_struct(png);
    if (info == nullptr) {
      png_destroy_write_struct(&png, nullptr);
      return R::error(EncodeError::kCodecFailed);
    }
    if (setjmp(png_jmpbuf(png)) != 0) {
      png_destroy_write_struct(&png, &info);
      out.clear();
      return R::error(EncodeError::kCodecFailed);
    }

    png_set_write_fn(png, &out, OnWrite, OnFlush);
    const int color_type = (frame.format == PixelFormat::kRgb24)
                               ? PNG_COLOR_TYPE_RGB
                               : PNG_COLOR_TYPE_RGB_ALPHA;
    png_set_IHDR(png, info, frame.width, frame.height, 8, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    if (frame.format == PixelFormat::kBgra32) {
      png_set_bgr(png);
    }
    for (uint32_t y = 0; y < frame.height; ++y) {
      png_write_row(png, frame.pixels + static_cast<size_t>(y) * frame.stride);
    }
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return R::success();
  }

 private:
  static void OnWrite(png_structp png, png_bytep data, png_size_t len) {
    auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + len);
  }

  static void OnFlush(png_structp /*png*/) {}

  static void OnError(png_structp png, png_const_charp msg) {
    MIRROR_LOG_WARN("ImageEncoder", "libpng: %s", msg);
    png_longjmp(png, 1);
  }

  static void OnWarning(png_structp /*png*/, png_const_charp msg) {
    MIRROR_LOG_DEBUG("ImageEncoder", "libpng warning: %s", msg);
  }
};

// ============================================================================
// CodecImageEncoder
// ============================================================================

/**
 * @brief Dispatches to the JPEG or PNG encoder according to the mode.
 */
class CodecImageEncoder final : public ImageEncoder {
 public:
  expected<void, EncodeError> Encode(const RawFrame& frame,
                                     const EncodingMode& mode,
                                     std::vector<uint8_t>& out) override {
    if (mode.codec == CodecKind::kLossless) {
      return png_.Encode(frame, mode, out);
    }
    return jpeg_.Encode(frame, mode, out);
  }

 private:
  JpegImageEncoder jpeg_;
  PngImageEncoder png_;
};

}  // namespace mirror

#endif  // MIRROR_IMAGE_ENCODER_HPP_
