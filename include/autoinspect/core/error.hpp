#pragma once

#include <string_view>

namespace autoinspect::core {

/// Inspection error codes; used with std::expected for recoverable failures.
enum class InspectionError {
  None = 0,
  InvalidImage,          // unsupported or undecodable upload, user-correctable
  MalformedDetection,    // detector broke its output contract
  DetectionUnavailable,  // detector failed or timed out, safe to resubmit
  Persistence,           // image store or ledger write failed
  InvalidRecord,         // record fields contradict each other
  InvalidConfig,
};

[[nodiscard]] std::string_view error_name(InspectionError e) noexcept;

}  // namespace autoinspect::core
