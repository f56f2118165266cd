#include <autoinspect/vision/onnx_inference_backend.hpp>
#include <autoinspect/core/error.hpp>
#include <autoinspect/core/frame.hpp>
#include <onnxruntime_cxx_api.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace autoinspect::vision {

namespace ac = autoinspect::core;

namespace {

constexpr int64_t kNumChannels = 3;
constexpr int64_t kYoloRowWidth = 6;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::size_t i = 0; i < hw; ++i) {
    nchw[0 * hw + i] = hwc[i * kNumChannels + 0];
    nchw[1 * hw + i] = hwc[i * kNumChannels + 1];
    nchw[2 * hw + i] = hwc[i * kNumChannels + 2];
  }
}

void push_box(InferenceResult& r, float x1, float y1, float x2, float y2) {
  r.boxes.push_back(x1);
  r.boxes.push_back(y1);
  r.boxes.push_back(x2);
  r.boxes.push_back(y2);
}

/// [1, N, 6] or [1, 6, N] -> InferenceResult. Negative N means the shape is unsupported.
std::expected<InferenceResult, ac::InspectionError> parse_single_output(Ort::Value& out) {
  const auto shape = out.GetTensorTypeAndShapeInfo().GetShape();
  const float* data = out.GetTensorData<float>();
  int64_t n = -1;
  bool rows_are_n6 = false;
  if (shape.size() == 3u && shape[0] == 1 && shape[2] == kYoloRowWidth) {
    n = shape[1];
    rows_are_n6 = true;
  } else if (shape.size() == 3u && shape[0] == 1 && shape[1] == kYoloRowWidth) {
    n = shape[2];
  }
  if (n < 0) {
    spdlog::error("unsupported detector output shape [{}]; export the model with NMS",
                  fmt::join(shape, ","));
    return std::unexpected(ac::InspectionError::MalformedDetection);
  }

  InferenceResult result;
  result.num_detections = static_cast<std::uint32_t>(n);
  const int64_t stride = rows_are_n6 ? kYoloRowWidth : n;
  for (int64_t i = 0; i < n; ++i) {
    auto at = [&](int64_t field) {
      return rows_are_n6 ? data[i * kYoloRowWidth + field] : data[field * stride + i];
    };
    push_box(result, at(0), at(1), at(2), at(3));
    result.scores.push_back(at(4));
    result.class_ids.push_back(static_cast<int64_t>(at(5)));
  }
  return result;
}

/// boxes / scores / class_ids outputs -> InferenceResult.
std::expected<InferenceResult, ac::InspectionError> parse_three_outputs(
    std::vector<Ort::Value>& outputs) {
  if (outputs.size() < 3u) {
    return std::unexpected(ac::InspectionError::MalformedDetection);
  }
  const std::vector<int64_t> boxes_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();

  // Support [1, N, 4], [1, 4, N] or [N, 4].
  int64_t n = -1;
  bool boxes_is_n4 = true;
  if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[2] == 4) {
    n = boxes_shape[1];
  } else if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[1] == 4) {
    n = boxes_shape[2];
    boxes_is_n4 = false;
  } else if (boxes_shape.size() == 2u && boxes_shape[1] == 4) {
    n = boxes_shape[0];
  }
  if (n < 0) {
    return std::unexpected(ac::InspectionError::MalformedDetection);
  }
  const std::size_t count = static_cast<std::size_t>(n);
  if (outputs[1].GetTensorTypeAndShapeInfo().GetElementCount() < count ||
      outputs[2].GetTensorTypeAndShapeInfo().GetElementCount() < count) {
    return std::unexpected(ac::InspectionError::MalformedDetection);
  }

  const float* boxes = outputs[0].GetTensorData<float>();
  const float* scores = outputs[1].GetTensorData<float>();
  const int64_t* classes = outputs[2].GetTensorData<int64_t>();

  InferenceResult result;
  result.num_detections = static_cast<std::uint32_t>(n);
  for (int64_t i = 0; i < n; ++i) {
    if (boxes_is_n4) {
      const float* row = boxes + i * 4;
      push_box(result, row[0], row[1], row[2], row[3]);
    } else {
      push_box(result, boxes[0 * n + i], boxes[1 * n + i], boxes[2 * n + i], boxes[3 * n + i]);
    }
    result.scores.push_back(scores[i]);
    result.class_ids.push_back(classes[i]);
  }
  return result;
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "autoinspect"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::array<std::string, 3> output_names;
  std::vector<const char*> output_name_ptrs;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};
  bool use_yolo_single_output{false};

  std::vector<float> nchw_buffer;

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(std::string model_path,
                                           std::string input_name,
                                           std::array<std::string, 3> output_names)
    : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
  }
  impl_->input_name = input_name.empty()
                          ? std::string(impl_->session.GetInputNameAllocated(0, allocator).get())
                          : std::move(input_name);

  const std::vector<int64_t> dims =
      impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxInferenceBackend: expected 4D input");
  }
  int64_t height = 0;
  int64_t width = 0;
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    height = dims[2];
    width = dims[3];
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    height = dims[1];
    width = dims[2];
  } else {
    throw std::runtime_error("OnnxInferenceBackend: expected input shape [1,3,H,W] or [1,H,W,3]");
  }
  if (height <= 0 || width <= 0) {
    throw std::runtime_error("OnnxInferenceBackend: dynamic input size is not supported");
  }
  impl_->input_height = static_cast<std::uint32_t>(height);
  impl_->input_width = static_cast<std::uint32_t>(width);

  const std::size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 1u) {
    impl_->use_yolo_single_output = true;
    impl_->output_names[0] = impl_->session.GetOutputNameAllocated(0, allocator).get();
    impl_->output_name_ptrs.push_back(impl_->output_names[0].c_str());
  } else if (num_outputs >= 3u) {
    for (std::size_t i = 0; i < 3u; ++i) {
      impl_->output_names[i] = output_names[i].empty()
                                   ? std::string(impl_->session.GetOutputNameAllocated(i, allocator).get())
                                   : output_names[i];
    }
    for (const auto& name : impl_->output_names) {
      impl_->output_name_ptrs.push_back(name.c_str());
    }
  } else {
    throw std::runtime_error(
        "OnnxInferenceBackend: model must have 1 output (YOLO-style) or at least 3 outputs");
  }
  spdlog::info("loaded ONNX model {} ({}x{}, {})", model_path, impl_->input_width,
               impl_->input_height, impl_->use_yolo_single_output ? "single output" : "three outputs");
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

std::optional<InputSize> OnnxInferenceBackend::input_size() const {
  return InputSize{impl_->input_width, impl_->input_height};
}

std::expected<void, ac::InspectionError> OnnxInferenceBackend::validate_input(
    const ac::Frame& input) const {
  if (!input.valid() || input.format() != ac::PixelFormat::Float32RGB) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }
  if (input.width() != impl_->input_width || input.height() != impl_->input_height) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }
  return {};
}

std::expected<InferenceResult, ac::InspectionError> OnnxInferenceBackend::infer(
    const ac::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const std::uint32_t h = input.height();
  const std::uint32_t w = input.width();
  const float* src = reinterpret_cast<const float*>(input.data().data());
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor{nullptr};
  if (impl_->input_is_nchw) {
    impl_->nchw_buffer.resize(num_floats);
    HwcToNchw(src, h, w, impl_->nchw_buffer.data());
    const std::array<int64_t, 4> shape{1, kNumChannels, static_cast<int64_t>(h),
                                       static_cast<int64_t>(w)};
    input_tensor = Ort::Value::CreateTensor<float>(mem_info, impl_->nchw_buffer.data(),
                                                   num_floats, shape.data(), shape.size());
  } else {
    const std::array<int64_t, 4> shape{1, static_cast<int64_t>(h), static_cast<int64_t>(w),
                                       kNumChannels};
    input_tensor = Ort::Value::CreateTensor<float>(mem_info, const_cast<float*>(src), num_floats,
                                                   shape.data(), shape.size());
  }

  const char* input_names_c[] = {impl_->input_name.c_str()};
  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(Ort::RunOptions{}, input_names_c, &input_tensor, 1,
                                 impl_->output_name_ptrs.data(),
                                 impl_->output_name_ptrs.size());
  } catch (const Ort::Exception& e) {
    spdlog::error("ONNX inference failed: {}", e.what());
    return std::unexpected(ac::InspectionError::DetectionUnavailable);
  }

  if (impl_->use_yolo_single_output) {
    if (outputs.size() != 1u) {
      return std::unexpected(ac::InspectionError::MalformedDetection);
    }
    return parse_single_output(outputs[0]);
  }
  return parse_three_outputs(outputs);
}

void OnnxInferenceBackend::warmup() {
  const std::size_t num_bytes =
      ac::Frame::min_bytes(impl_->input_width, impl_->input_height, ac::PixelFormat::Float32RGB);
  std::vector<std::byte> buffer(num_bytes, std::byte{0});
  ac::Frame frame(impl_->input_width, impl_->input_height, ac::PixelFormat::Float32RGB,
                  std::move(buffer));
  auto result = infer(frame);
  if (!result) {
    spdlog::warn("ONNX warmup failed: {}", ac::error_name(result.error()));
  }
}

}  // namespace autoinspect::vision
