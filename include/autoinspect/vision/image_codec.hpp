#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace autoinspect::vision {

/// Upload formats accepted by the inspection portal.
enum class ImageFormat : std::uint8_t {
  Jpeg,
  Png,
};

/// Format from the leading magic bytes; nullopt for anything but JPEG or PNG.
[[nodiscard]] std::optional<ImageFormat> sniff_format(std::span<const std::byte> bytes) noexcept;

/// Format from a file extension ("jpg", ".JPEG", "png"); nullopt if not accepted.
[[nodiscard]] std::optional<ImageFormat> format_from_extension(std::string_view extension);

/// Canonical file extension without the dot: "jpg" or "png".
[[nodiscard]] std::string_view extension_for(ImageFormat format) noexcept;

/// Decodes JPEG/PNG bytes into a BGR8, BGRA8 or Grayscale8 frame. JPEGs are decoded as
/// BGR8 with EXIF orientation applied; 16-bit PNGs are scaled to 8 bits.
/// InvalidImage if the format is not accepted or the bytes do not decode.
[[nodiscard]] std::expected<autoinspect::core::Frame, autoinspect::core::InspectionError>
decode_image(std::span<const std::byte> bytes);

/// Encodes a frame (BGR8, BGRA8 or Grayscale8). InvalidImage if the frame cannot be encoded.
[[nodiscard]] std::expected<std::vector<std::byte>, autoinspect::core::InspectionError>
encode_image(const autoinspect::core::Frame& frame, ImageFormat format);

}  // namespace autoinspect::vision
