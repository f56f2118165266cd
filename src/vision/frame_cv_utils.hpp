#pragma once

#include <autoinspect/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace autoinspect::vision::detail {

/// Non-owning cv::Mat view over a Frame's pixels. nullopt if the frame is invalid.
/// The view must not outlive the frame and must not be written through.
std::optional<cv::Mat> frame_to_mat(const autoinspect::core::Frame& frame);

/// Deep copy of a cv::Mat into a tightly packed Frame.
autoinspect::core::Frame mat_to_frame(const cv::Mat& mat,
                                      autoinspect::core::PixelFormat format);

}  // namespace autoinspect::vision::detail
