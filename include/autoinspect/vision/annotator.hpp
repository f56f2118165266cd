#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/core/finding.hpp>
#include <autoinspect/core/frame.hpp>
#include <autoinspect/vision/style_table.hpp>
#include <expected>
#include <string>

namespace autoinspect::vision {

/// Stroke and label geometry shared by every finding.
struct AnnotatorOptions {
  int box_thickness{3};
  double font_scale{0.7};
  int text_thickness{2};
  int label_padding{10};  // added to the text width and height for the label background
  Color text_color{255, 255, 255};
};

/// Label drawn above a finding's box: "<class> | <NN>%".
[[nodiscard]] std::string finding_label(const autoinspect::core::Finding& finding);

/// Label background placement in image coordinates; right/bottom are exclusive.
struct LabelRect {
  int left{0};
  int top{0};
  int right{0};
  int bottom{0};
};

/// Places a label of the given text size above bbox, clamped into a width x height canvas.
/// The label moves down to row 0 instead of leaving the top edge, and left to fit the
/// right edge when it is narrower than the canvas.
[[nodiscard]] LabelRect place_label(const autoinspect::core::BBox& bbox,
                                    int text_width,
                                    int text_height,
                                    int padding,
                                    int width,
                                    int height) noexcept;

/// Draws findings onto a copy of an image. The style table is fixed at construction;
/// annotate() is const and safe to call from several threads.
class Annotator {
 public:
  explicit Annotator(StyleTable styles, AnnotatorOptions options = {});

  /// Returns a new frame with one box and label per finding, in FindingSet order.
  /// The source frame is never modified. Grayscale input yields a BGR8 frame; output
  /// dimensions always equal the input's. InvalidImage for an empty or unsupported frame.
  [[nodiscard]] std::expected<autoinspect::core::Frame, autoinspect::core::InspectionError>
  annotate(const autoinspect::core::Frame& image,
           const autoinspect::core::FindingSet& findings) const;

  [[nodiscard]] const StyleTable& styles() const noexcept { return styles_; }

 private:
  StyleTable styles_;
  AnnotatorOptions options_;
};

}  // namespace autoinspect::vision
