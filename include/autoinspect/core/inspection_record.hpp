#pragma once

#include <autoinspect/core/finding.hpp>
#include <autoinspect/core/status.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace autoinspect::core {

/// Operator identity issued by the external identity provider. Only id is persisted;
/// display_name is used to compose storage keys.
struct OperatorRef {
  std::string id;
  std::string display_name;
};

/// Opaque reference returned by an image store (a storage key).
using ImageRef = std::string;

/// One persisted inspection. Records are append-only: created once, never updated.
/// Invariant: status == Fail exactly when finding_count > 0.
struct InspectionRecord {
  std::int64_t id{0};
  std::string operator_id;
  ImageRef source_image;
  ImageRef annotated_image;
  VehicleStatus status{VehicleStatus::Pass};
  std::string defect_classes;     // display text, e.g. "dent, scratch" or "None"
  std::string confidence_scores;  // display text, e.g. "42.00%, 87.50%" or "N/A"
  std::size_t finding_count{0};
  std::chrono::system_clock::time_point created_at{};
};

/// Aggregate over one operator's records; total == pass_count + fail_count.
struct InspectionCounts {
  std::size_t total{0};
  std::size_t pass_count{0};
  std::size_t fail_count{0};
};

/// Class name and display confidence for one finding in a summary.
struct FindingSummary {
  std::string class_name;
  std::string confidence;  // e.g. "42.00%"
};

/// Display-ready result of processing one upload.
struct InspectionSummary {
  std::int64_t record_id{0};
  VehicleStatus status{VehicleStatus::Pass};
  std::vector<FindingSummary> findings;
  std::size_t finding_count{0};
  ImageRef source_image;
  ImageRef annotated_image;
  std::chrono::system_clock::time_point created_at{};
};

/// Confidence as a percentage with the given number of decimals: 0.4213 -> "42.13%".
[[nodiscard]] std::string format_confidence(float confidence, int decimals = 2);

/// Class names joined by ", ", or "None" when empty.
[[nodiscard]] std::string summarize_classes(const FindingSet& findings);

/// Confidences (two decimals) joined by ", ", or "N/A" when empty.
[[nodiscard]] std::string summarize_confidences(const FindingSet& findings);

/// Server-local timestamp as "YYYY-mm-dd HH:MM:SS".
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace autoinspect::core
