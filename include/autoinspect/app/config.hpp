#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/vision/detection_decoder.hpp>
#include <autoinspect/vision/style_table.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <istream>
#include <string>

namespace autoinspect::app {

/// Inference backend type: mock (synthetic) or onnx (real model).
enum class InferenceBackendType {
  Mock,
  Onnx,
};

/// Portal configuration: storage locations, detector, rendering, logging.
struct InspectionConfig {
  std::string database_path;
  std::string storage_root;
  InferenceBackendType backend_type{InferenceBackendType::Mock};
  std::string model_path;
  vision::ClassNames class_names;
  float confidence_threshold{0.05f};    // detector cutoff, deliberately permissive
  std::uint32_t detection_timeout_ms{30000};  // 0 = unbounded
  std::size_t recent_limit{5};
  std::string log_level{"info"};
  vision::StyleTable styles;
};

/// Default config when no file is provided.
InspectionConfig default_config();

/// Parses key=value lines ('#' comments, blank lines ignored) over the defaults.
/// Unknown keys are ignored with a warning; malformed values yield InvalidConfig.
[[nodiscard]] std::expected<InspectionConfig, core::InspectionError> parse_config(std::istream& in);

/// Loads a config file. A missing file yields the defaults.
[[nodiscard]] std::expected<InspectionConfig, core::InspectionError> load_config(
    const std::string& path);

}  // namespace autoinspect::app
