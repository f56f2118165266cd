#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/core/finding.hpp>
#include <expected>
#include <vector>

namespace autoinspect::core {

/// Validates raw detector output and converts it to a FindingSet.
///
/// Rejects the whole set with MalformedDetection when any entry has an empty class name,
/// a non-finite or out-of-range confidence, a non-finite coordinate, or an inverted or
/// zero-area box. Boxes are rounded outward to whole pixels (x1/y1 down, x2/y2 up), so a
/// box narrower than one pixel becomes one pixel wide. Confidence is not thresholded here
/// and class names are passed through unchanged, known or not. Order is preserved.
[[nodiscard]] std::expected<FindingSet, InspectionError> normalize(
    const std::vector<RawFinding>& raw);

}  // namespace autoinspect::core
