#include "frame_cv_utils.hpp"
#include <autoinspect/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace autoinspect::vision::detail {

namespace ac = autoinspect::core;

namespace {

int mat_type(ac::PixelFormat format) {
  switch (format) {
    case ac::PixelFormat::Grayscale8:
      return CV_8UC1;
    case ac::PixelFormat::BGR8:
    case ac::PixelFormat::RGB8:
      return CV_8UC3;
    case ac::PixelFormat::BGRA8:
      return CV_8UC4;
    case ac::PixelFormat::Float32RGB:
      return CV_32FC3;
    case ac::PixelFormat::Unknown:
    default:
      return -1;
  }
}

}  // namespace

std::optional<cv::Mat> frame_to_mat(const ac::Frame& frame) {
  if (!frame.valid()) return std::nullopt;
  const int type = mat_type(frame.format());
  if (type < 0) return std::nullopt;

  return cv::Mat(static_cast<int>(frame.height()), static_cast<int>(frame.width()), type,
                 const_cast<std::byte*>(frame.data().data()));
}

ac::Frame mat_to_frame(const cv::Mat& mat, ac::PixelFormat format) {
  if (mat.empty()) return ac::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return ac::Frame(static_cast<std::uint32_t>(packed.cols),
                   static_cast<std::uint32_t>(packed.rows), format, std::move(buffer));
}

}  // namespace autoinspect::vision::detail
