// OnnxInferenceBackend tests. Only the missing-file test runs without a model; the rest
// need a detector exported to ONNX. Set AUTOINSPECT_TEST_ONNX_MODEL to its path to run them.
#include <autoinspect/core/error.hpp>
#include <autoinspect/core/frame.hpp>
#include <autoinspect/vision/onnx_inference_backend.hpp>
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace av = autoinspect::vision;
namespace ac = autoinspect::core;

static std::string get_test_model_path() {
  const char* env = std::getenv("AUTOINSPECT_TEST_ONNX_MODEL");
  if (env && env[0] != '\0' && std::filesystem::exists(env)) {
    return env;
  }
  return "";
}

static ac::Frame make_float_frame(std::uint32_t w, std::uint32_t h) {
  const std::size_t num_bytes = ac::Frame::min_bytes(w, h, ac::PixelFormat::Float32RGB);
  std::vector<std::byte> buffer(num_bytes, std::byte{0});
  return ac::Frame(w, h, ac::PixelFormat::Float32RGB, std::move(buffer));
}

TEST(OnnxInferenceBackend, ConstructorThrowsWhenFileMissing) {
  EXPECT_THROW(
      { av::OnnxInferenceBackend backend("nonexistent_vehicle_model_12345.onnx"); },
      Ort::Exception);
}

TEST(OnnxInferenceBackend, ReportsFixedInputSize) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set AUTOINSPECT_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  av::OnnxInferenceBackend backend(path);
  auto size = backend.input_size();
  ASSERT_TRUE(size.has_value());
  EXPECT_GT(size->width, 0u);
  EXPECT_GT(size->height, 0u);
}

TEST(OnnxInferenceBackend, ValidateInputRejectsWrongFrames) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set AUTOINSPECT_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  av::OnnxInferenceBackend backend(path);
  auto empty = backend.validate_input(ac::Frame{});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), ac::InspectionError::InvalidImage);

  const auto size = *backend.input_size();
  std::vector<std::byte> buf(static_cast<std::size_t>(size.width) * size.height * 3);
  ac::Frame bytes(size.width, size.height, ac::PixelFormat::BGR8, std::move(buf));
  EXPECT_FALSE(backend.validate_input(bytes).has_value());

  EXPECT_FALSE(backend.validate_input(make_float_frame(size.width + 1, size.height)).has_value());
  EXPECT_TRUE(backend.validate_input(make_float_frame(size.width, size.height)).has_value());
}

TEST(OnnxInferenceBackend, InferReturnsConsistentArrays) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set AUTOINSPECT_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  av::OnnxInferenceBackend backend(path);
  EXPECT_NO_THROW(backend.warmup());
  const auto size = *backend.input_size();
  auto result = backend.infer(make_float_frame(size.width, size.height));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->boxes.size(), result->num_detections * 4u);
  EXPECT_EQ(result->scores.size(), result->num_detections);
  EXPECT_EQ(result->class_ids.size(), result->num_detections);
}
