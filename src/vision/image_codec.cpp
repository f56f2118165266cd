#include <autoinspect/vision/image_codec.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace autoinspect::vision {

namespace ac = autoinspect::core;

namespace {

constexpr std::array<std::uint8_t, 3> kJpegMagic{0xFF, 0xD8, 0xFF};
constexpr std::array<std::uint8_t, 8> kPngMagic{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

template <std::size_t N>
bool starts_with(std::span<const std::byte> bytes, const std::array<std::uint8_t, N>& magic) {
  if (bytes.size() < N) return false;
  for (std::size_t i = 0; i < N; ++i) {
    if (std::to_integer<std::uint8_t>(bytes[i]) != magic[i]) return false;
  }
  return true;
}

}  // namespace

std::optional<ImageFormat> sniff_format(std::span<const std::byte> bytes) noexcept {
  if (starts_with(bytes, kJpegMagic)) return ImageFormat::Jpeg;
  if (starts_with(bytes, kPngMagic)) return ImageFormat::Png;
  return std::nullopt;
}

std::optional<ImageFormat> format_from_extension(std::string_view extension) {
  if (!extension.empty() && extension.front() == '.') extension.remove_prefix(1);
  std::string ext(extension);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == "jpg" || ext == "jpeg") return ImageFormat::Jpeg;
  if (ext == "png") return ImageFormat::Png;
  return std::nullopt;
}

std::string_view extension_for(ImageFormat format) noexcept {
  return format == ImageFormat::Png ? "png" : "jpg";
}

std::expected<ac::Frame, ac::InspectionError> decode_image(std::span<const std::byte> bytes) {
  const auto format = sniff_format(bytes);
  if (!format) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }

  // JPEG: 8-bit BGR with EXIF orientation applied. PNG: keep gray/alpha channels.
  const int flags = *format == ImageFormat::Jpeg ? cv::IMREAD_COLOR : cv::IMREAD_UNCHANGED;
  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::byte*>(bytes.data()));
  cv::Mat mat;
  try {
    mat = cv::imdecode(raw, flags);
  } catch (const cv::Exception&) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }
  if (mat.empty()) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }
  if (mat.depth() == CV_16U) {
    cv::Mat narrowed;
    mat.convertTo(narrowed, CV_8U, 1.0 / 257.0);
    mat = narrowed;
  } else if (mat.depth() != CV_8U) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }

  switch (mat.channels()) {
    case 1:
      return detail::mat_to_frame(mat, ac::PixelFormat::Grayscale8);
    case 3:
      return detail::mat_to_frame(mat, ac::PixelFormat::BGR8);
    case 4:
      return detail::mat_to_frame(mat, ac::PixelFormat::BGRA8);
    default:
      return std::unexpected(ac::InspectionError::InvalidImage);
  }
}

std::expected<std::vector<std::byte>, ac::InspectionError> encode_image(const ac::Frame& frame,
                                                                        ImageFormat format) {
  if (frame.format() != ac::PixelFormat::BGR8 && frame.format() != ac::PixelFormat::BGRA8 &&
      frame.format() != ac::PixelFormat::Grayscale8) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }
  auto mat = detail::frame_to_mat(frame);
  if (!mat) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }

  std::vector<std::uint8_t> encoded;
  const std::string ext = format == ImageFormat::Png ? ".png" : ".jpg";
  try {
    if (!cv::imencode(ext, *mat, encoded)) {
      return std::unexpected(ac::InspectionError::InvalidImage);
    }
  } catch (const cv::Exception&) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }

  std::vector<std::byte> out(encoded.size());
  std::transform(encoded.begin(), encoded.end(), out.begin(),
                 [](std::uint8_t b) { return static_cast<std::byte>(b); });
  return out;
}

}  // namespace autoinspect::vision
