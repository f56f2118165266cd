#include <autoinspect/vision/annotator.hpp>
#include "frame_cv_utils.hpp"
#include <autoinspect/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace autoinspect::vision {

namespace ac = autoinspect::core;

namespace {

constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;

cv::Scalar to_scalar(Color c, int channels) {
  if (channels == 4) return cv::Scalar(c.b, c.g, c.r, 255);
  return cv::Scalar(c.b, c.g, c.r);
}

}  // namespace

std::string finding_label(const ac::Finding& finding) {
  std::ostringstream out;
  out << finding.class_name << " | "
      << static_cast<long>(std::lround(static_cast<double>(finding.confidence) * 100.0)) << '%';
  return out.str();
}

LabelRect place_label(const ac::BBox& bbox,
                      int text_width,
                      int text_height,
                      int padding,
                      int width,
                      int height) noexcept {
  const int label_w = text_width + padding;
  const int label_h = text_height + padding;

  LabelRect r;
  r.left = bbox.x1;
  r.top = bbox.y1 - label_h;
  if (r.left + label_w > width) r.left = width - label_w;
  r.left = std::max(r.left, 0);
  if (r.top + label_h > height) r.top = height - label_h;
  r.top = std::max(r.top, 0);
  r.right = r.left + label_w;
  r.bottom = r.top + label_h;
  return r;
}

Annotator::Annotator(StyleTable styles, AnnotatorOptions options)
    : styles_(std::move(styles)), options_(options) {}

std::expected<ac::Frame, ac::InspectionError> Annotator::annotate(
    const ac::Frame& image, const ac::FindingSet& findings) const {
  const ac::PixelFormat in_format = image.format();
  if (in_format != ac::PixelFormat::BGR8 && in_format != ac::PixelFormat::BGRA8 &&
      in_format != ac::PixelFormat::Grayscale8) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }
  auto view = detail::frame_to_mat(image);
  if (!view) {
    return std::unexpected(ac::InspectionError::InvalidImage);
  }

  cv::Mat canvas;
  ac::PixelFormat out_format = in_format;
  if (in_format == ac::PixelFormat::Grayscale8) {
    cv::cvtColor(*view, canvas, cv::COLOR_GRAY2BGR);
    out_format = ac::PixelFormat::BGR8;
  } else {
    canvas = view->clone();
  }

  const int channels = canvas.channels();
  const cv::Scalar text_color = to_scalar(options_.text_color, channels);

  for (const auto& f : findings) {
    const cv::Scalar color = to_scalar(styles_.color_for(f.class_name), channels);
    cv::rectangle(canvas, cv::Point(f.bbox.x1, f.bbox.y1), cv::Point(f.bbox.x2, f.bbox.y2),
                  color, options_.box_thickness);

    const std::string label = finding_label(f);
    int baseline = 0;
    const cv::Size text =
        cv::getTextSize(label, kFont, options_.font_scale, options_.text_thickness, &baseline);
    const LabelRect r = place_label(f.bbox, text.width, text.height, options_.label_padding,
                                    canvas.cols, canvas.rows);

    cv::rectangle(canvas, cv::Point(r.left, r.top), cv::Point(r.right, r.bottom), color,
                  cv::FILLED);
    const int half_pad = options_.label_padding / 2;
    cv::putText(canvas, label, cv::Point(r.left + half_pad, r.bottom - half_pad), kFont,
                options_.font_scale, text_color, options_.text_thickness);
  }

  return detail::mat_to_frame(canvas, out_format);
}

}  // namespace autoinspect::vision
