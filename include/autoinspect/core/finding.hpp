#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace autoinspect::core {

/// Axis-aligned box in pixel coordinates of the source image: (x1, y1) top-left,
/// (x2, y2) bottom-right. A valid box has x1 < x2 and y1 < y2.
struct BBox {
  std::int32_t x1{0};
  std::int32_t y1{0};
  std::int32_t x2{0};
  std::int32_t y2{0};

  [[nodiscard]] std::int32_t width() const noexcept { return x2 - x1; }
  [[nodiscard]] std::int32_t height() const noexcept { return y2 - y1; }
};

/// Detector output before validation. Coordinates are (x1, y1, x2, y2) in source pixels.
struct RawFinding {
  std::string class_name;
  double confidence{0.0};
  std::array<double, 4> bbox{};
};

/// Single validated defect localization: class, confidence in [0, 1], box.
struct Finding {
  std::string class_name;
  float confidence{0.f};
  BBox bbox{};
};

/// Findings for one image, in detector-emitted order. May be empty.
using FindingSet = std::vector<Finding>;

}  // namespace autoinspect::core
