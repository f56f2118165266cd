#include <autoinspect/core/status.hpp>

namespace autoinspect::core {

namespace {

constexpr std::string_view kPassLabel = "Non-Broken";
constexpr std::string_view kFailLabel = "Broken";

}  // namespace

VehicleStatus classify(const FindingSet& findings) noexcept {
  return findings.empty() ? VehicleStatus::Pass : VehicleStatus::Fail;
}

std::string_view status_label(VehicleStatus status) noexcept {
  return status == VehicleStatus::Fail ? kFailLabel : kPassLabel;
}

std::optional<VehicleStatus> parse_status_label(std::string_view label) noexcept {
  if (label == kPassLabel) return VehicleStatus::Pass;
  if (label == kFailLabel) return VehicleStatus::Fail;
  return std::nullopt;
}

}  // namespace autoinspect::core
