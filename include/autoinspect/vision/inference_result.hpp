#pragma once

#include <cstdint>
#include <vector>

namespace autoinspect::vision {

/// Raw model output before decoding. Boxes are [x1,y1,x2,y2] per detection in the
/// pixel space of the frame handed to the backend.
struct InferenceResult {
  std::vector<float> boxes;
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};
};

}  // namespace autoinspect::vision
