#include <autoinspect/app/config.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <optional>
#include <sstream>
#include <string_view>
#include <vector>

namespace autoinspect::app {

namespace ac = autoinspect::core;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> out;
  std::istringstream in(value);
  std::string item;
  while (std::getline(in, item, ',')) {
    trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

template <typename T>
std::optional<T> parse_number(const std::string& value) {
  T out{};
  const char* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, out);
  if (ec != std::errc() || ptr != end) return std::nullopt;
  return out;
}

/// "B,G,R" with each channel in 0..255.
std::optional<vision::Color> parse_color(const std::string& value) {
  const auto parts = split_list(value);
  if (parts.size() != 3) return std::nullopt;
  std::uint8_t ch[3];
  for (std::size_t i = 0; i < 3; ++i) {
    const auto v = parse_number<unsigned>(parts[i]);
    if (!v || *v > 255) return std::nullopt;
    ch[i] = static_cast<std::uint8_t>(*v);
  }
  return vision::Color{ch[0], ch[1], ch[2]};
}

bool known_log_level(const std::string& level) {
  return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
         level == "error" || level == "critical" || level == "off";
}

}  // namespace

InspectionConfig default_config() {
  InspectionConfig c;
  c.database_path = "inspections.db";
  c.storage_root = "static";
  c.backend_type = InferenceBackendType::Mock;
  c.model_path = "";
  c.class_names = vision::default_class_names();
  c.confidence_threshold = 0.05f;
  c.detection_timeout_ms = 30000;
  c.recent_limit = 5;
  c.log_level = "info";
  c.styles = vision::StyleTable::defaults();
  return c;
}

std::expected<InspectionConfig, ac::InspectionError> parse_config(std::istream& in) {
  InspectionConfig c = default_config();

  std::string line;
  std::string key;
  std::string value;
  int line_no = 0;
  auto invalid = [&]() {
    spdlog::error("config line {}: invalid value '{}' for {}", line_no, value, key);
    return std::unexpected(ac::InspectionError::InvalidConfig);
  };

  while (std::getline(in, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      spdlog::warn("config line {}: expected key=value", line_no);
      continue;
    }

    if (key == "database_path") c.database_path = value;
    else if (key == "storage_root") c.storage_root = value;
    else if (key == "model_path") c.model_path = value;
    else if (key == "backend_type") {
      if (value == "onnx") c.backend_type = InferenceBackendType::Onnx;
      else if (value == "mock") c.backend_type = InferenceBackendType::Mock;
      else return invalid();
    }
    else if (key == "class_names") {
      c.class_names = split_list(value);
      if (c.class_names.empty()) return invalid();
    }
    else if (key == "confidence_threshold") {
      const auto v = parse_number<float>(value);
      if (!v || *v < 0.f || *v > 1.f) return invalid();
      c.confidence_threshold = *v;
    }
    else if (key == "detection_timeout_ms") {
      const auto v = parse_number<std::uint32_t>(value);
      if (!v) return invalid();
      c.detection_timeout_ms = *v;
    }
    else if (key == "recent_limit") {
      const auto v = parse_number<std::size_t>(value);
      if (!v || *v == 0) return invalid();
      c.recent_limit = *v;
    }
    else if (key == "log_level") {
      if (!known_log_level(value)) return invalid();
      c.log_level = value;
    }
    else if (key.starts_with("color.")) {
      const auto color = parse_color(value);
      const std::string class_name = key.substr(6);
      if (!color || class_name.empty()) return invalid();
      c.styles = c.styles.with_color(class_name, *color);
    }
    else {
      spdlog::warn("config line {}: unknown key '{}'", line_no, key);
    }
  }
  return c;
}

std::expected<InspectionConfig, ac::InspectionError> load_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("config {} not found, using defaults", path);
    return default_config();
  }
  return parse_config(f);
}

}  // namespace autoinspect::app
