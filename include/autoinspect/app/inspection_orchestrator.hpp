#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/core/inspection_record.hpp>
#include <autoinspect/storage/image_store.hpp>
#include <autoinspect/storage/inspection_ledger.hpp>
#include <autoinspect/vision/annotator.hpp>
#include <autoinspect/vision/detector.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace autoinspect::app {

/// Processing stages reported to a StageTimingCallback, in execution order.
enum class InspectionStage : std::size_t {
  Decode = 0,
  Detect,
  Normalize,
  Annotate,
  Classify,
  StoreImages,
  Persist,
};

/// Callback for per-stage timing: (stage, duration_ms). Optional; pass to process().
using StageTimingCallback = std::function<void(InspectionStage stage, double duration_ms)>;

struct OrchestratorOptions {
  std::string upload_prefix{"uploads"};
  std::string result_prefix{"results"};
};

/// Turns one uploaded image into a stored inspection:
/// decode -> detect -> normalize -> annotate -> classify -> store images -> persist.
/// Each step depends on the previous one; the first failure ends the request and no
/// record is created. Clean images go through every step and yield a Pass record.
///
/// Thread-safe when the detector, image store and ledger are: process() keeps no
/// per-request state in the orchestrator.
class InspectionOrchestrator {
 public:
  /// Collaborators must outlive the orchestrator. Wrap the detector in a
  /// vision::TimedDetector to bound detection time.
  InspectionOrchestrator(std::shared_ptr<vision::IDetector> detector,
                         vision::Annotator annotator,
                         storage::IImageStore& images,
                         storage::IInspectionLedger& ledger,
                         OrchestratorOptions options = {});

  /// InvalidImage: not a decodable JPEG/PNG.
  /// DetectionUnavailable: the detector failed, threw or timed out; not retried.
  /// MalformedDetection: the detector's output broke its contract.
  /// Persistence: an image or the record could not be stored.
  [[nodiscard]] std::expected<core::InspectionSummary, core::InspectionError> process(
      const core::OperatorRef& op,
      std::span<const std::byte> image_bytes,
      StageTimingCallback* timing_cb = nullptr) const;

 private:
  std::shared_ptr<vision::IDetector> detector_;
  vision::Annotator annotator_;
  storage::IImageStore& images_;
  storage::IInspectionLedger& ledger_;
  OrchestratorOptions options_;
};

[[nodiscard]] std::string_view stage_name(InspectionStage stage) noexcept;

}  // namespace autoinspect::app
