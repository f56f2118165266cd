#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace autoinspect::core {

/// Memory: Frame owns one contiguous, tightly packed buffer (std::vector<std::byte>).
/// Copying a Frame copies its pixels, so an annotated copy never aliases its source.
/// Thread-safety: distinct Frame instances are independent; sharing one Frame
/// across threads requires external synchronization.

/// Pixel layout. 8-bit formats are interleaved; Float32RGB is interleaved HWC float,
/// the layout handed to inference backends.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  BGR8,
  BGRA8,
  RGB8,
  Float32RGB,
};

/// Channels per pixel for a format; 0 for Unknown.
[[nodiscard]] std::uint32_t channel_count(PixelFormat format) noexcept;

/// Decoded image: dimensions, format and owned pixel buffer.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when dimensions are non-zero, the format is known and the buffer is large enough.
  [[nodiscard]] bool valid() const noexcept;

  /// Bytes required for the given dimensions and format.
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace autoinspect::core
