#include <autoinspect/vision/detection_decoder.hpp>
#include <cstddef>

namespace autoinspect::vision {

namespace ac = autoinspect::core;

ClassNames default_class_names() {
  return {"dent", "scratch", "lamp_broken", "glass_broken", "tire_flat"};
}

DetectionDecoder::DetectionDecoder(float min_confidence, ClassNames class_names)
    : min_confidence_(min_confidence), class_names_(std::move(class_names)) {}

std::string DetectionDecoder::class_name(std::int64_t class_id) const {
  if (class_id >= 0 && static_cast<std::size_t>(class_id) < class_names_.size()) {
    return class_names_[static_cast<std::size_t>(class_id)];
  }
  return "class_" + std::to_string(class_id);
}

std::expected<std::vector<ac::RawFinding>, ac::InspectionError> DetectionDecoder::decode(
    const InferenceResult& result, double scale_x, double scale_y) const {
  const std::size_t n = static_cast<std::size_t>(result.num_detections);
  if (result.scores.size() < n || result.class_ids.size() < n || result.boxes.size() < n * 4) {
    return std::unexpected(ac::InspectionError::MalformedDetection);
  }

  std::vector<ac::RawFinding> out;
  for (std::size_t i = 0; i < n; ++i) {
    const float score = result.scores[i];
    // NaN scores are not filtered here; the normalizer rejects them.
    if (score < min_confidence_) {
      continue;
    }

    ac::RawFinding r;
    r.class_name = class_name(result.class_ids[i]);
    r.confidence = static_cast<double>(score);
    r.bbox = {static_cast<double>(result.boxes[i * 4 + 0]) * scale_x,
              static_cast<double>(result.boxes[i * 4 + 1]) * scale_y,
              static_cast<double>(result.boxes[i * 4 + 2]) * scale_x,
              static_cast<double>(result.boxes[i * 4 + 3]) * scale_y};
    out.push_back(std::move(r));
  }
  return out;
}

}  // namespace autoinspect::vision
