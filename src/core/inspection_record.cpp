#include <autoinspect/core/inspection_record.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace autoinspect::core {

std::string format_confidence(float confidence, int decimals) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(decimals)
      << static_cast<double>(confidence) * 100.0 << '%';
  return out.str();
}

std::string summarize_classes(const FindingSet& findings) {
  if (findings.empty()) return "None";
  std::string out;
  for (std::size_t i = 0; i < findings.size(); ++i) {
    if (i > 0) out += ", ";
    out += findings[i].class_name;
  }
  return out;
}

std::string summarize_confidences(const FindingSet& findings) {
  if (findings.empty()) return "N/A";
  std::string out;
  for (std::size_t i = 0; i < findings.size(); ++i) {
    if (i > 0) out += ", ";
    out += format_confidence(findings[i].confidence);
  }
  return out;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

}  // namespace autoinspect::core
