#include <autoinspect/app/inspection_orchestrator.hpp>
#include <autoinspect/core/finding_normalizer.hpp>
#include <autoinspect/core/status.hpp>
#include <autoinspect/vision/image_codec.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <utility>

namespace autoinspect::app {

namespace ac = autoinspect::core;

namespace {

/// Reports the time since construction (or the last lap) for one stage.
class StageClock {
 public:
  explicit StageClock(StageTimingCallback* cb) : cb_(cb), start_(std::chrono::steady_clock::now()) {}

  void lap(InspectionStage stage) {
    const auto now = std::chrono::steady_clock::now();
    const double ms = 1e-3 * static_cast<double>(
        std::chrono::duration_cast<std::chrono::microseconds>(now - start_).count());
    spdlog::debug("stage {} took {:.3f} ms", stage_name(stage), ms);
    if (cb_) (*cb_)(stage, ms);
    start_ = now;
  }

 private:
  StageTimingCallback* cb_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace

std::string_view stage_name(InspectionStage stage) noexcept {
  switch (stage) {
    case InspectionStage::Decode:
      return "decode";
    case InspectionStage::Detect:
      return "detect";
    case InspectionStage::Normalize:
      return "normalize";
    case InspectionStage::Annotate:
      return "annotate";
    case InspectionStage::Classify:
      return "classify";
    case InspectionStage::StoreImages:
      return "store_images";
    case InspectionStage::Persist:
      return "persist";
  }
  return "unknown";
}

InspectionOrchestrator::InspectionOrchestrator(std::shared_ptr<vision::IDetector> detector,
                                               vision::Annotator annotator,
                                               storage::IImageStore& images,
                                               storage::IInspectionLedger& ledger,
                                               OrchestratorOptions options)
    : detector_(std::move(detector)),
      annotator_(std::move(annotator)),
      images_(images),
      ledger_(ledger),
      options_(std::move(options)) {}

std::expected<ac::InspectionSummary, ac::InspectionError> InspectionOrchestrator::process(
    const ac::OperatorRef& op,
    std::span<const std::byte> image_bytes,
    StageTimingCallback* timing_cb) const {
  StageClock clock(timing_cb);

  const auto format = vision::sniff_format(image_bytes);
  if (!format) {
    spdlog::warn("rejected upload from {}: not a JPEG or PNG image", op.id);
    return std::unexpected(ac::InspectionError::InvalidImage);
  }
  auto image = vision::decode_image(image_bytes);
  if (!image) {
    spdlog::warn("rejected upload from {}: image does not decode", op.id);
    return std::unexpected(image.error());
  }
  clock.lap(InspectionStage::Decode);

  if (!detector_) {
    return std::unexpected(ac::InspectionError::DetectionUnavailable);
  }
  std::expected<std::vector<ac::RawFinding>, ac::InspectionError> raw;
  try {
    raw = detector_->detect(*image);
  } catch (const std::exception& e) {
    spdlog::error("detector threw for {}: {}", op.id, e.what());
    return std::unexpected(ac::InspectionError::DetectionUnavailable);
  }
  if (!raw) {
    if (raw.error() == ac::InspectionError::MalformedDetection) {
      spdlog::error("detector returned malformed output for {}", op.id);
    } else {
      spdlog::warn("detection unavailable for {}: {}", op.id, ac::error_name(raw.error()));
    }
    return std::unexpected(raw.error());
  }
  clock.lap(InspectionStage::Detect);

  auto findings = ac::normalize(*raw);
  if (!findings) {
    spdlog::error("detector output for {} failed validation ({} raw findings)", op.id,
                  raw->size());
    return std::unexpected(findings.error());
  }
  clock.lap(InspectionStage::Normalize);

  auto annotated = annotator_.annotate(*image, *findings);
  if (!annotated) {
    return std::unexpected(annotated.error());
  }
  clock.lap(InspectionStage::Annotate);

  const ac::VehicleStatus status = ac::classify(*findings);
  clock.lap(InspectionStage::Classify);

  auto annotated_bytes = vision::encode_image(*annotated, *format);
  if (!annotated_bytes) {
    return std::unexpected(annotated_bytes.error());
  }
  const std::string name = storage::make_image_name(
      op.display_name.empty() ? op.id : op.display_name, std::chrono::system_clock::now(),
      vision::extension_for(*format));
  auto source_ref = images_.put(options_.upload_prefix + "/" + name, image_bytes);
  if (!source_ref) {
    return std::unexpected(source_ref.error());
  }
  auto annotated_ref = images_.put(options_.result_prefix + "/" + name, *annotated_bytes);
  if (!annotated_ref) {
    return std::unexpected(annotated_ref.error());
  }
  clock.lap(InspectionStage::StoreImages);

  auto record = ledger_.create(op, *source_ref, *annotated_ref, status, *findings);
  if (!record) {
    spdlog::error("inspection for {} not saved: {}", op.id, ac::error_name(record.error()));
    return std::unexpected(record.error());
  }
  clock.lap(InspectionStage::Persist);

  ac::InspectionSummary summary;
  summary.record_id = record->id;
  summary.status = record->status;
  summary.finding_count = record->finding_count;
  summary.source_image = record->source_image;
  summary.annotated_image = record->annotated_image;
  summary.created_at = record->created_at;
  summary.findings.reserve(findings->size());
  for (const auto& f : *findings) {
    summary.findings.push_back({f.class_name, ac::format_confidence(f.confidence)});
  }
  return summary;
}

}  // namespace autoinspect::app
