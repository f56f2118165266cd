#include <autoinspect/core/error.hpp>

namespace autoinspect::core {

std::string_view error_name(InspectionError e) noexcept {
  switch (e) {
    case InspectionError::None:
      return "None";
    case InspectionError::InvalidImage:
      return "InvalidImage";
    case InspectionError::MalformedDetection:
      return "MalformedDetection";
    case InspectionError::DetectionUnavailable:
      return "DetectionUnavailable";
    case InspectionError::Persistence:
      return "Persistence";
    case InspectionError::InvalidRecord:
      return "InvalidRecord";
    case InspectionError::InvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

}  // namespace autoinspect::core
