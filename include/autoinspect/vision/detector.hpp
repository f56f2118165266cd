#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/core/finding.hpp>
#include <autoinspect/core/frame.hpp>
#include <autoinspect/vision/detection_decoder.hpp>
#include <autoinspect/vision/inference_backend.hpp>
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <vector>

namespace autoinspect::vision {

/// Detection capability boundary: decoded image -> raw findings in source pixels.
class IDetector {
 public:
  virtual ~IDetector() = default;

  /// DetectionUnavailable when the capability cannot answer; MalformedDetection when
  /// its output is structurally broken.
  [[nodiscard]] virtual std::expected<std::vector<autoinspect::core::RawFinding>,
                                      autoinspect::core::InspectionError>
  detect(const autoinspect::core::Frame& image) = 0;
};

/// Runs an inference backend on a decoded image: resize to the backend's input size,
/// BGR -> RGB, scale to [0, 1] floats, infer, then decode boxes back to source pixels.
/// Calls into the backend are serialized.
class ModelDetector : public IDetector {
 public:
  ModelDetector(std::shared_ptr<IInferenceBackend> backend, DetectionDecoder decoder);

  [[nodiscard]] std::expected<std::vector<autoinspect::core::RawFinding>,
                              autoinspect::core::InspectionError>
  detect(const autoinspect::core::Frame& image) override;

 private:
  std::shared_ptr<IInferenceBackend> backend_;
  DetectionDecoder decoder_;
  std::mutex backend_mutex_;
};

/// Bounds a detector call by a timeout. The inner call runs on its own thread; when the
/// timeout expires the caller gets DetectionUnavailable and the late answer is dropped.
/// While a timed-out call is still running, new calls are refused at once with
/// DetectionUnavailable. A zero timeout calls the inner detector directly.
class TimedDetector : public IDetector {
 public:
  TimedDetector(std::shared_ptr<IDetector> inner, std::chrono::milliseconds timeout);

  [[nodiscard]] std::expected<std::vector<autoinspect::core::RawFinding>,
                              autoinspect::core::InspectionError>
  detect(const autoinspect::core::Frame& image) override;

  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

 private:
  std::shared_ptr<IDetector> inner_;
  std::chrono::milliseconds timeout_;
  /// Timed-out calls whose worker thread has not returned yet.
  std::shared_ptr<std::atomic<int>> abandoned_;
};

}  // namespace autoinspect::vision
