#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace autoinspect::vision {

/// 8-bit color in OpenCV channel order (blue, green, red).
struct Color {
  std::uint8_t b{0};
  std::uint8_t g{0};
  std::uint8_t r{0};

  friend bool operator==(const Color&, const Color&) = default;
};

/// Neutral green used for classes missing from the table.
inline constexpr Color kFallbackColor{0, 255, 0};

/// Immutable class-name -> color mapping handed to the Annotator at construction.
/// Lookups are const and safe to share across threads.
class StyleTable {
 public:
  using ColorMap = std::map<std::string, Color, std::less<>>;

  StyleTable() = default;
  explicit StyleTable(ColorMap colors, Color fallback = kFallbackColor);

  /// Palette for the vehicle defect model: dent, scratch, lamp_broken, glass_broken, tire_flat.
  [[nodiscard]] static StyleTable defaults();

  /// Color for a class; the fallback color if the class is unknown.
  [[nodiscard]] Color color_for(std::string_view class_name) const;

  [[nodiscard]] bool contains(std::string_view class_name) const;
  [[nodiscard]] Color fallback() const noexcept { return fallback_; }
  [[nodiscard]] const ColorMap& colors() const noexcept { return colors_; }

  /// Copy of this table with one entry added or replaced.
  [[nodiscard]] StyleTable with_color(std::string class_name, Color color) const;

 private:
  ColorMap colors_;
  Color fallback_{kFallbackColor};
};

}  // namespace autoinspect::vision
