#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/vision/inference_backend.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace autoinspect::vision {

/// One synthetic detection: class id, score and (x1, y1, x2, y2) box.
struct MockDetection {
  std::int64_t class_id{0};
  float score{0.f};
  float x1{0.f};
  float y1{0.f};
  float x2{0.f};
  float y2{0.f};
};

/// Mock backend that returns configurable synthetic detections (for tests/demo).
/// Configure before sharing across threads; infer() only reads the configuration.
class MockInferenceBackend : public IInferenceBackend {
 public:
  /// Detections to return on every infer() call.
  void set_detections(std::vector<MockDetection> detections);

  /// Make infer() fail with the given error instead of returning detections.
  void fail_with(autoinspect::core::InspectionError error) { failure_ = error; }

  /// Sleep this long inside infer() before answering.
  void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

  [[nodiscard]] std::expected<InferenceResult, autoinspect::core::InspectionError>
  infer(const autoinspect::core::Frame& input) override;

  [[nodiscard]] std::expected<void, autoinspect::core::InspectionError>
  validate_input(const autoinspect::core::Frame& input) const override;

 private:
  std::vector<MockDetection> detections_;
  std::optional<autoinspect::core::InspectionError> failure_;
  std::chrono::milliseconds delay_{0};
};

}  // namespace autoinspect::vision
