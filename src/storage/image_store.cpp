#include <autoinspect/storage/image_store.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cctype>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <random>
#include <sstream>
#include <system_error>

namespace autoinspect::storage {

namespace ac = autoinspect::core;
namespace fs = std::filesystem;

namespace {

bool is_safe_key(const fs::path& key) {
  if (key.empty() || key.is_absolute() || key.has_root_name()) return false;
  for (const auto& part : key) {
    if (part == "..") return false;
  }
  return true;
}

std::string random_suffix() {
  thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<std::uint32_t> dist;
  std::ostringstream out;
  out << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
  return out.str();
}

}  // namespace

FileImageStore::FileImageStore(fs::path root) : root_(std::move(root)) {}

fs::path FileImageStore::path_for(const ac::ImageRef& ref) const {
  return root_ / fs::path(ref);
}

std::expected<ac::ImageRef, ac::InspectionError> FileImageStore::put(
    std::string_view key, std::span<const std::byte> bytes) {
  const fs::path rel(key);
  if (!is_safe_key(rel)) {
    spdlog::error("refusing image key '{}'", key);
    return std::unexpected(ac::InspectionError::Persistence);
  }
  const fs::path target = root_ / rel;

  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    spdlog::error("cannot create {}: {}", target.parent_path().string(), ec.message());
    return std::unexpected(ac::InspectionError::Persistence);
  }

  static std::atomic<std::uint64_t> sequence{0};
  fs::path tmp = target;
  tmp += ".tmp" + std::to_string(sequence.fetch_add(1));
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (f) {
      f.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    }
    if (!f) {
      spdlog::error("cannot write {}", tmp.string());
      fs::remove(tmp, ec);
      return std::unexpected(ac::InspectionError::Persistence);
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    spdlog::error("cannot move {} into place: {}", target.string(), ec.message());
    fs::remove(tmp, ec);
    return std::unexpected(ac::InspectionError::Persistence);
  }
  return rel.generic_string();
}

std::expected<std::vector<std::byte>, ac::InspectionError> FileImageStore::get(
    const ac::ImageRef& ref) const {
  const fs::path rel(ref);
  if (!is_safe_key(rel)) {
    return std::unexpected(ac::InspectionError::Persistence);
  }
  std::ifstream f(root_ / rel, std::ios::binary);
  if (!f) {
    return std::unexpected(ac::InspectionError::Persistence);
  }
  std::vector<char> raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  std::vector<std::byte> out(raw.size());
  std::memcpy(out.data(), raw.data(), raw.size());
  return out;
}

std::string make_image_name(std::string_view operator_name,
                            std::chrono::system_clock::time_point now,
                            std::string_view extension) {
  std::string name;
  for (const char c : operator_name) {
    const auto u = static_cast<unsigned char>(c);
    name += (std::isalnum(u) || c == '_' || c == '-') ? c : '_';
  }
  if (name.empty()) name = "operator";

  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);

  std::ostringstream out;
  out << name << '_' << std::put_time(&tm, "%Y%m%d_%H%M%S") << '_' << random_suffix() << '.'
      << extension;
  return out.str();
}

}  // namespace autoinspect::storage
