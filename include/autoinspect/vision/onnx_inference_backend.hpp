#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/core/frame.hpp>
#include <autoinspect/vision/inference_backend.hpp>
#include <autoinspect/vision/inference_result.hpp>
#include <array>
#include <memory>
#include <string>

namespace autoinspect::vision {

/// ONNX Runtime inference backend for exported defect detectors.
///
/// Expected model: one float image input ([1,3,H,W] or [1,H,W,3]) and either:
/// - **One output (YOLO-style)**: [1, N, 6] or [1, 6, N] with
///   (xmin, ymin, xmax, ymax, score, class_id) per detection, in input pixels.
/// - **Three outputs**: boxes [1,N,4] / [1,4,N] / [N,4], scores [1,N], class_ids [1,N].
///
/// The model must be exported with NMS included, so each row is already a final
/// detection (Ultralytics `export(format="onnx", nms=True)`, or an end-to-end YOLOv10
/// head). Raw heads such as [1, 4 + num_classes, anchors] are not decoded here and infer()
/// reports them as MalformedDetection. A [1, 6, 6] output is read as [1, N, 6].
///
/// Input contract: Float32RGB frame sized to input_size(). ModelDetector prepares it.
/// Not thread-safe; ModelDetector serializes calls.
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx model file. Throws Ort::Exception if it cannot
  ///        be loaded and std::runtime_error if its signature is unsupported.
  /// \param input_name Optional input tensor name; if empty, the first input is used.
  /// \param output_names Optional {boxes, scores, class_ids}; empty names are taken from
  ///        the model's first three outputs.
  explicit OnnxInferenceBackend(std::string model_path,
                                std::string input_name = {},
                                std::array<std::string, 3> output_names = {});

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<InferenceResult, autoinspect::core::InspectionError>
  infer(const autoinspect::core::Frame& input) override;

  [[nodiscard]] std::expected<void, autoinspect::core::InspectionError>
  validate_input(const autoinspect::core::Frame& input) const override;

  [[nodiscard]] std::optional<InputSize> input_size() const override;

  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace autoinspect::vision
