#pragma once

#include <autoinspect/core/finding.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace autoinspect::core {

/// Binary vehicle condition. Stored with the labels "Non-Broken" / "Broken".
enum class VehicleStatus : std::uint8_t {
  Pass,
  Fail,
};

/// Fail if any finding is present, regardless of confidence or class.
[[nodiscard]] VehicleStatus classify(const FindingSet& findings) noexcept;

[[nodiscard]] std::string_view status_label(VehicleStatus status) noexcept;

/// Inverse of status_label; nullopt for any other text.
[[nodiscard]] std::optional<VehicleStatus> parse_status_label(std::string_view label) noexcept;

}  // namespace autoinspect::core
