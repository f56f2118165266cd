#include <autoinspect/core/error.hpp>
#include <autoinspect/core/frame.hpp>
#include <autoinspect/vision/mock_inference_backend.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <vector>

namespace av = autoinspect::vision;
namespace ac = autoinspect::core;

TEST(MockInferenceBackend, ReturnsSetDetections) {
  av::MockInferenceBackend mock;
  mock.set_detections({
      {0, 0.95f, 1.f, 2.f, 3.f, 4.f},
      {3, 0.8f, 5.f, 6.f, 7.f, 8.f},
  });
  std::vector<std::byte> buf(100);
  ac::Frame f(10, 10, ac::PixelFormat::Grayscale8, std::move(buf));
  auto result = mock.infer(f);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->num_detections, 2u);
  EXPECT_EQ(result->scores.size(), 2u);
  EXPECT_EQ(result->boxes.size(), 8u);
  EXPECT_FLOAT_EQ(result->scores[0], 0.95f);
  EXPECT_EQ(result->class_ids[1], 3);
  EXPECT_FLOAT_EQ(result->boxes[4], 5.f);
}

TEST(MockInferenceBackend, ValidateInputRejectsEmptyFrame) {
  av::MockInferenceBackend mock;
  ac::Frame empty;
  auto valid = mock.validate_input(empty);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), ac::InspectionError::InvalidImage);
  EXPECT_FALSE(mock.infer(empty).has_value());
}

TEST(MockInferenceBackend, ConfiguredFailure) {
  av::MockInferenceBackend mock;
  mock.fail_with(ac::InspectionError::DetectionUnavailable);
  std::vector<std::byte> buf(4);
  ac::Frame f(2, 2, ac::PixelFormat::Grayscale8, std::move(buf));
  auto result = mock.infer(f);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), ac::InspectionError::DetectionUnavailable);
}

TEST(MockInferenceBackend, DelayIsApplied) {
  av::MockInferenceBackend mock;
  mock.set_delay(std::chrono::milliseconds(30));
  std::vector<std::byte> buf(4);
  ac::Frame f(2, 2, ac::PixelFormat::Grayscale8, std::move(buf));
  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(mock.infer(f).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(30));
}

TEST(MockInferenceBackend, NoInputSize) {
  av::MockInferenceBackend mock;
  EXPECT_FALSE(mock.input_size().has_value());
}
