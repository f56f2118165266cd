#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/core/finding.hpp>
#include <autoinspect/vision/inference_result.hpp>
#include <expected>
#include <string>
#include <vector>

namespace autoinspect::vision {

/// Model class id -> class name. Index i names class id i.
using ClassNames = std::vector<std::string>;

/// Class names the vehicle defect model is trained on, in class-id order.
[[nodiscard]] ClassNames default_class_names();

/// Decodes InferenceResult -> RawFinding list. Applies the detection capability's
/// minimum-confidence cutoff and maps class ids to names ("class_<id>" when the id has
/// no name). Boxes are scaled by (scale_x, scale_y) back to source image pixels.
class DetectionDecoder {
 public:
  DetectionDecoder(float min_confidence, ClassNames class_names);

  /// MalformedDetection when the result's arrays are shorter than num_detections.
  [[nodiscard]] std::expected<std::vector<autoinspect::core::RawFinding>,
                              autoinspect::core::InspectionError>
  decode(const InferenceResult& result, double scale_x = 1.0, double scale_y = 1.0) const;

  void set_min_confidence(float t) noexcept { min_confidence_ = t; }
  [[nodiscard]] float min_confidence() const noexcept { return min_confidence_; }

  [[nodiscard]] std::string class_name(std::int64_t class_id) const;

 private:
  float min_confidence_;
  ClassNames class_names_;
};

}  // namespace autoinspect::vision
