#include <autoinspect/vision/style_table.hpp>
#include <utility>

namespace autoinspect::vision {

StyleTable::StyleTable(ColorMap colors, Color fallback)
    : colors_(std::move(colors)), fallback_(fallback) {}

StyleTable StyleTable::defaults() {
  return StyleTable(ColorMap{
      {"dent", Color{203, 192, 255}},       // pink
      {"scratch", Color{255, 0, 0}},        // blue
      {"lamp_broken", Color{0, 255, 255}},  // yellow
      {"glass_broken", Color{128, 0, 128}}, // purple
      {"tire_flat", Color{0, 0, 255}},      // red
  });
}

Color StyleTable::color_for(std::string_view class_name) const {
  const auto it = colors_.find(class_name);
  return it == colors_.end() ? fallback_ : it->second;
}

bool StyleTable::contains(std::string_view class_name) const {
  return colors_.find(class_name) != colors_.end();
}

StyleTable StyleTable::with_color(std::string class_name, Color color) const {
  ColorMap copy = colors_;
  copy.insert_or_assign(std::move(class_name), color);
  return StyleTable(std::move(copy), fallback_);
}

}  // namespace autoinspect::vision
