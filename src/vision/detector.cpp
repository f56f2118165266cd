#include <autoinspect/vision/detector.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <future>
#include <thread>
#include <utility>

namespace autoinspect::vision {

namespace ac = autoinspect::core;

namespace {

using DetectResult = std::expected<std::vector<ac::RawFinding>, ac::InspectionError>;

/// BGR8 / BGRA8 / Grayscale8 -> Float32RGB in [0, 1], resized when size is set.
std::optional<ac::Frame> to_model_input(const ac::Frame& image,
                                        const std::optional<InputSize>& size) {
  auto view = detail::frame_to_mat(image);
  if (!view) return std::nullopt;

  cv::Mat rgb;
  switch (image.format()) {
    case ac::PixelFormat::BGR8:
      cv::cvtColor(*view, rgb, cv::COLOR_BGR2RGB);
      break;
    case ac::PixelFormat::BGRA8:
      cv::cvtColor(*view, rgb, cv::COLOR_BGRA2RGB);
      break;
    case ac::PixelFormat::Grayscale8:
      cv::cvtColor(*view, rgb, cv::COLOR_GRAY2RGB);
      break;
    case ac::PixelFormat::RGB8:
      rgb = view->clone();
      break;
    default:
      return std::nullopt;
  }

  if (size && (static_cast<std::uint32_t>(rgb.cols) != size->width ||
               static_cast<std::uint32_t>(rgb.rows) != size->height)) {
    cv::Mat resized;
    cv::resize(rgb, resized,
               cv::Size(static_cast<int>(size->width), static_cast<int>(size->height)), 0, 0,
               cv::INTER_LINEAR);
    rgb = resized;
  }

  cv::Mat scaled;
  rgb.convertTo(scaled, CV_32FC3, 1.0 / 255.0);
  return detail::mat_to_frame(scaled, ac::PixelFormat::Float32RGB);
}

}  // namespace

ModelDetector::ModelDetector(std::shared_ptr<IInferenceBackend> backend,
                             DetectionDecoder decoder)
    : backend_(std::move(backend)), decoder_(std::move(decoder)) {}

DetectResult ModelDetector::detect(const ac::Frame& image) {
  if (!backend_) {
    return std::unexpected(ac::InspectionError::DetectionUnavailable);
  }
  const std::optional<InputSize> size = backend_->input_size();
  auto input = to_model_input(image, size);
  if (!input) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }

  std::expected<InferenceResult, ac::InspectionError> result;
  {
    std::lock_guard lock(backend_mutex_);
    auto valid = backend_->validate_input(*input);
    if (!valid) {
      return std::unexpected(valid.error());
    }
    result = backend_->infer(*input);
  }
  if (!result) {
    return std::unexpected(result.error());
  }

  const double scale_x = static_cast<double>(image.width()) / input->width();
  const double scale_y = static_cast<double>(image.height()) / input->height();
  return decoder_.decode(*result, scale_x, scale_y);
}

TimedDetector::TimedDetector(std::shared_ptr<IDetector> inner,
                             std::chrono::milliseconds timeout)
    : inner_(std::move(inner)),
      timeout_(timeout),
      abandoned_(std::make_shared<std::atomic<int>>(0)) {}

DetectResult TimedDetector::detect(const ac::Frame& image) {
  if (!inner_) {
    return std::unexpected(ac::InspectionError::DetectionUnavailable);
  }
  if (timeout_.count() <= 0) {
    return inner_->detect(image);
  }

  if (abandoned_->load() > 0) {
    spdlog::warn("detection refused: a timed-out call is still running");
    return std::unexpected(ac::InspectionError::DetectionUnavailable);
  }

  // The task owns a copy of the image and a reference on the detector, so a call that
  // outlives the timeout never touches caller state.
  auto task = std::make_shared<std::packaged_task<DetectResult()>>(
      [inner = inner_, frame = image]() { return inner->detect(frame); });
  std::future<DetectResult> future = task->get_future();

  // 0 running, 1 done, 2 abandoned by the caller.
  auto state = std::make_shared<std::atomic<int>>(0);
  std::thread([task, state, abandoned = abandoned_]() {
    (*task)();
    if (state->exchange(1) == 2) {
      abandoned->fetch_sub(1);
    }
  }).detach();

  if (future.wait_for(timeout_) != std::future_status::ready) {
    abandoned_->fetch_add(1);
    int running = 0;
    if (state->compare_exchange_strong(running, 2)) {
      spdlog::warn("detection timed out after {} ms", timeout_.count());
      return std::unexpected(ac::InspectionError::DetectionUnavailable);
    }
    // The worker finished between the wait and the hand-off; its answer is ready.
    abandoned_->fetch_sub(1);
  }
  try {
    return future.get();
  } catch (const std::exception& e) {
    spdlog::error("detection failed: {}", e.what());
    return std::unexpected(ac::InspectionError::DetectionUnavailable);
  }
}

}  // namespace autoinspect::vision
