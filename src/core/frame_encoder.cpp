#include "core/frame_encoder.hpp"

#include <cstring>
#include <iostream>
#include <string>
#include <utility>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace flk {

const char* PixelFormatName(PixelFormat f) {
  switch (f) {
    case PixelFormat::Yuv420: return "yuv420";
    case PixelFormat::Jpeg: return "jpeg";
    case PixelFormat::Unknown: return "unknown";
  }
  return "unknown";
}

const char* EncodeStatusName(EncodeStatus s) {
  switch (s) {
    case EncodeStatus::Ok: return "ok";
    case EncodeStatus::TooLarge: return "too_large";
    case EncodeStatus::Failed: return "failed";
  }
  return "failed";
}

// Checks that 'rows' x 'cols' samples can be read from the plane with its strides
static bool PlaneCovers(const Plane& p, int rows, int cols) {
  if (!p.data || rows <= 0 || cols <= 0) return false;
  if (p.row_stride <= 0 || p.pixel_stride <= 0) return false;
  const std::size_t last = static_cast<std::size_t>(rows - 1) * static_cast<std::size_t>(p.row_stride) +
                           static_cast<std::size_t>(cols - 1) * static_cast<std::size_t>(p.pixel_stride);
  return last < p.size;
}

// Copy a plane into a tightly packed cols-wide destination, one row at a time
static void CopyPlane(const Plane& p, int rows, int cols, std::uint8_t* dst) {
  for (int r = 0; r < rows; ++r) {
    const std::uint8_t* src = p.data + static_cast<std::size_t>(r) * p.row_stride;
    if (p.pixel_stride == 1) {
      std::memcpy(dst, src, static_cast<std::size_t>(cols));
      dst += cols;
    } else {
      for (int c = 0; c < cols; ++c) *dst++ = src[static_cast<std::size_t>(c) * p.pixel_stride];
    }
  }
}

FrameEncoder::FrameEncoder(EncoderConfig cfg) : cfg_(std::move(cfg)) {}

bool FrameEncoder::PackNv21(const RawFrame& frame, std::vector<std::uint8_t>& out, std::string& error) {
  const int w = frame.width;
  const int h = frame.height;

  if (w <= 0 || h <= 0 || (w % 2) != 0 || (h % 2) != 0) {
    error = "frame size must be positive and even, got " + std::to_string(w) + "x" + std::to_string(h);
    return false;
  }
  if (frame.plane_count < 3) {
    error = "planar frame needs 3 planes, got " + std::to_string(frame.plane_count);
    return false;
  }

  const Plane& y = frame.planes[0];
  const Plane& u = frame.planes[1];
  const Plane& v = frame.planes[2];
  const int cw = w / 2;
  const int ch = h / 2;

  if (!PlaneCovers(y, h, w) || !PlaneCovers(u, ch, cw) || !PlaneCovers(v, ch, cw)) {
    error = "plane buffers are smaller than the declared geometry";
    return false;
  }

  const std::size_t y_size = static_cast<std::size_t>(w) * h;
  out.assign(y_size + y_size / 2, 0);

  CopyPlane(y, h, w, out.data());

  // Sensors report U and V in the reverse pair order NV21 expects, write V first
  std::uint8_t* vu = out.data() + y_size;
  for (int r = 0; r < ch; ++r) {
    const std::uint8_t* vrow = v.data + static_cast<std::size_t>(r) * v.row_stride;
    const std::uint8_t* urow = u.data + static_cast<std::size_t>(r) * u.row_stride;
    for (int c = 0; c < cw; ++c) {
      *vu++ = vrow[static_cast<std::size_t>(c) * v.pixel_stride];
      *vu++ = urow[static_cast<std::size_t>(c) * u.pixel_stride];
    }
  }

  return true;
}

EncodeResult FrameEncoder::finish(std::vector<std::uint8_t> bytes, const RawFrame& frame) const {
  EncodeResult res;
  if (bytes.size() > cfg_.max_frame_bytes) {
    res.status = EncodeStatus::TooLarge;
    res.error = "frame is " + std::to_string(bytes.size()) + " bytes, limit is " + std::to_string(cfg_.max_frame_bytes);
    return res;
  }

  res.status = EncodeStatus::Ok;
  res.frame.bytes = std::move(bytes);
  res.frame.capture_time_ms = frame.capture_time_ms;
  return res;
}

EncodeResult FrameEncoder::encode(const RawFrame& frame) {
  EncodeResult res;

  // Already compressed, copy the bytes out of the capture buffer as they are
  if (frame.format == PixelFormat::Jpeg) {
    const Plane& p = frame.planes[0];
    if (frame.plane_count < 1 || !p.data || p.size == 0) {
      res.error = "jpeg frame has no data";
      return res;
    }
    return finish(std::vector<std::uint8_t>(p.data, p.data + p.size), frame);
  }

  if (frame.format != PixelFormat::Yuv420) {
    std::cerr << "[frame_encoder] unsupported pixel format '" << PixelFormatName(frame.format)
              << "', trying yuv420 conversion" << std::endl;
  }

  const int w = frame.width;
  const int h = frame.height;
  const int cw = w / 2;
  const int ch = h / 2;

  // Packed chroma (pixel step 1) goes straight into an I420 buffer, anything else is walked into NV21
  const bool packed_chroma = frame.plane_count >= 3 &&
                             frame.planes[1].pixel_stride == 1 &&
                             frame.planes[2].pixel_stride == 1;

  std::vector<std::uint8_t> yuv;
  int code = cv::COLOR_YUV2BGR_NV21;

  if (packed_chroma) {
    if (w <= 0 || h <= 0 || (w % 2) != 0 || (h % 2) != 0 ||
        !PlaneCovers(frame.planes[0], h, w) ||
        !PlaneCovers(frame.planes[1], ch, cw) ||
        !PlaneCovers(frame.planes[2], ch, cw)) {
      res.error = "invalid planar frame " + std::to_string(w) + "x" + std::to_string(h);
      return res;
    }

    const std::size_t y_size = static_cast<std::size_t>(w) * h;
    const std::size_t c_size = static_cast<std::size_t>(cw) * ch;
    yuv.assign(y_size + 2 * c_size, 0);
    CopyPlane(frame.planes[0], h, w, yuv.data());
    CopyPlane(frame.planes[1], ch, cw, yuv.data() + y_size);
    CopyPlane(frame.planes[2], ch, cw, yuv.data() + y_size + c_size);
    code = cv::COLOR_YUV2BGR_I420;
  } else if (!PackNv21(frame, yuv, res.error)) {
    return res;
  }

  std::vector<std::uint8_t> jpeg;
  try {
    cv::Mat yuv_mat(h + h / 2, w, CV_8UC1, yuv.data());
    cv::Mat bgr;
    cv::cvtColor(yuv_mat, bgr, code);

    const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, cfg_.jpeg_quality};
    if (!cv::imencode(".jpg", bgr, jpeg, params)) {
      res.error = "jpeg compression failed";
      return res;
    }
  } catch (const cv::Exception& e) {
    res.error = std::string("jpeg compression failed: ") + e.what();
    return res;
  }

  return finish(std::move(jpeg), frame);
}

} // namespace flk
