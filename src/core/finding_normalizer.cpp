#include <autoinspect/core/finding_normalizer.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

namespace autoinspect::core {

namespace {

/// Whole-pixel coordinate; nullopt if not representable.
std::optional<std::int32_t> to_pixel(double t) {
  if (t < static_cast<double>(std::numeric_limits<std::int32_t>::min()) ||
      t > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
    return std::nullopt;
  }
  return static_cast<std::int32_t>(t);
}

std::optional<Finding> normalize_one(const RawFinding& r) {
  if (r.class_name.empty()) return std::nullopt;
  if (!std::isfinite(r.confidence) || r.confidence < 0.0 || r.confidence > 1.0) {
    return std::nullopt;
  }
  for (const double v : r.bbox) {
    if (!std::isfinite(v)) return std::nullopt;
  }
  if (r.bbox[0] >= r.bbox[2] || r.bbox[1] >= r.bbox[3]) return std::nullopt;

  // Outward rounding: the pixel box covers the raw box, so it is at least 1 px wide.
  const auto x1 = to_pixel(std::floor(r.bbox[0]));
  const auto y1 = to_pixel(std::floor(r.bbox[1]));
  const auto x2 = to_pixel(std::ceil(r.bbox[2]));
  const auto y2 = to_pixel(std::ceil(r.bbox[3]));
  if (!x1 || !y1 || !x2 || !y2) return std::nullopt;

  Finding f;
  f.class_name = r.class_name;
  f.confidence = static_cast<float>(r.confidence);
  f.bbox = BBox{*x1, *y1, *x2, *y2};
  return f;
}

}  // namespace

std::expected<FindingSet, InspectionError> normalize(const std::vector<RawFinding>& raw) {
  FindingSet out;
  out.reserve(raw.size());
  for (const auto& r : raw) {
    auto f = normalize_one(r);
    if (!f) {
      return std::unexpected(InspectionError::MalformedDetection);
    }
    out.push_back(std::move(*f));
  }
  return out;
}

}  // namespace autoinspect::core
