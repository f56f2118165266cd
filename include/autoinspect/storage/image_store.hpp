#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/core/inspection_record.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace autoinspect::storage {

/// Blob storage for raw and annotated images, addressed by key.
class IImageStore {
 public:
  virtual ~IImageStore() = default;

  /// Stores bytes under key; the returned reference is what records carry.
  /// Persistence on write failure.
  [[nodiscard]] virtual std::expected<autoinspect::core::ImageRef, autoinspect::core::InspectionError>
  put(std::string_view key, std::span<const std::byte> bytes) = 0;

  /// Persistence if the reference does not resolve.
  [[nodiscard]] virtual std::expected<std::vector<std::byte>, autoinspect::core::InspectionError>
  get(const autoinspect::core::ImageRef& ref) const = 0;
};

/// Stores images as files under a root directory. Keys are relative paths
/// ("uploads/<name>"); keys that are absolute or contain ".." are refused.
/// Each write goes to a temporary file that is renamed into place.
class FileImageStore : public IImageStore {
 public:
  explicit FileImageStore(std::filesystem::path root);

  [[nodiscard]] std::expected<autoinspect::core::ImageRef, autoinspect::core::InspectionError>
  put(std::string_view key, std::span<const std::byte> bytes) override;

  [[nodiscard]] std::expected<std::vector<std::byte>, autoinspect::core::InspectionError>
  get(const autoinspect::core::ImageRef& ref) const override;

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

  /// Absolute location of a reference inside the store.
  [[nodiscard]] std::filesystem::path path_for(const autoinspect::core::ImageRef& ref) const;

 private:
  std::filesystem::path root_;
};

/// Upload file name "<operator>_<YYYYmmdd_HHMMSS>_<8 hex>.<extension>". The operator
/// name is reduced to [A-Za-z0-9_-]; the random suffix keeps concurrent uploads by the
/// same operator within one second apart.
[[nodiscard]] std::string make_image_name(std::string_view operator_name,
                                          std::chrono::system_clock::time_point now,
                                          std::string_view extension);

}  // namespace autoinspect::storage
