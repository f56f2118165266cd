#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/core/inspection_record.hpp>
#include <autoinspect/storage/inspection_ledger.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <ostream>
#include <string>
#include <vector>

namespace autoinspect::app {

/// One record, formatted for display.
struct HistoryRow {
  std::int64_t id{0};
  std::string status;             // "Broken" / "Non-Broken"
  std::string defect_classes;
  std::string confidence_scores;
  std::size_t finding_count{0};
  std::string timestamp;          // "YYYY-mm-dd HH:MM:SS"
  std::string source_image;
  std::string annotated_image;
};

/// Operator landing page: totals and the latest inspections.
struct DashboardView {
  std::string operator_name;
  core::InspectionCounts counts;
  storage::ClassCounts class_counts;
  std::vector<HistoryRow> recent;
};

[[nodiscard]] HistoryRow to_history_row(const core::InspectionRecord& record);

/// Counts, per-class totals and the recent_limit newest records for one operator.
[[nodiscard]] std::expected<DashboardView, core::InspectionError> build_dashboard(
    const storage::IInspectionLedger& ledger,
    const core::OperatorRef& op,
    std::size_t recent_limit = 5);

/// Every record for one operator, newest first.
[[nodiscard]] std::expected<std::vector<HistoryRow>, core::InspectionError> build_history(
    const storage::IInspectionLedger& ledger, const core::OperatorRef& op);

void print_dashboard(std::ostream& out, const DashboardView& view);
void print_history(std::ostream& out, const std::vector<HistoryRow>& rows);
void print_summary(std::ostream& out, const core::InspectionSummary& summary);

}  // namespace autoinspect::app
