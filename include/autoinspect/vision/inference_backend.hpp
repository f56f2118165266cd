#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/core/frame.hpp>
#include <autoinspect/vision/inference_result.hpp>
#include <cstdint>
#include <expected>
#include <optional>

namespace autoinspect::vision {

/// Fixed model input dimensions.
struct InputSize {
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// Abstract inference backend: Float32RGB frame -> InferenceResult.
/// Implement infer(); optionally override validate_input, input_size, warmup.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Single-frame inference on an HWC Float32RGB frame scaled to [0, 1].
  /// DetectionUnavailable when the model cannot produce a result.
  [[nodiscard]] virtual std::expected<InferenceResult, autoinspect::core::InspectionError>
  infer(const autoinspect::core::Frame& input) = 0;

  /// Optional: validate frame format/dimensions before infer. Default: accept.
  [[nodiscard]] virtual std::expected<void, autoinspect::core::InspectionError>
  validate_input(const autoinspect::core::Frame& /*input*/) const {
    return {};
  }

  /// Dimensions frames must be resized to; nullopt if any size is accepted.
  [[nodiscard]] virtual std::optional<InputSize> input_size() const { return std::nullopt; }

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace autoinspect::vision
