#include <autoinspect/vision/mock_inference_backend.hpp>
#include <autoinspect/core/error.hpp>
#include <thread>
#include <vector>

namespace autoinspect::vision {

void MockInferenceBackend::set_detections(std::vector<MockDetection> detections) {
  detections_ = std::move(detections);
}

static InferenceResult mock_to_result(const std::vector<MockDetection>& detections) {
  InferenceResult r;
  r.num_detections = static_cast<std::uint32_t>(detections.size());
  for (const auto& d : detections) {
    r.boxes.push_back(d.x1);
    r.boxes.push_back(d.y1);
    r.boxes.push_back(d.x2);
    r.boxes.push_back(d.y2);
    r.scores.push_back(d.score);
    r.class_ids.push_back(d.class_id);
  }
  return r;
}

std::expected<InferenceResult, autoinspect::core::InspectionError>
MockInferenceBackend::infer(const autoinspect::core::Frame& input) {
  if (delay_.count() > 0) {
    std::this_thread::sleep_for(delay_);
  }
  if (failure_) {
    return std::unexpected(*failure_);
  }
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  return mock_to_result(detections_);
}

std::expected<void, autoinspect::core::InspectionError>
MockInferenceBackend::validate_input(const autoinspect::core::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(autoinspect::core::InspectionError::InvalidImage);
  }
  return {};
}

}  // namespace autoinspect::vision
