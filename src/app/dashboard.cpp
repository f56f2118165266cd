#include <autoinspect/app/dashboard.hpp>
#include <autoinspect/core/status.hpp>

namespace autoinspect::app {

namespace ac = autoinspect::core;

HistoryRow to_history_row(const ac::InspectionRecord& record) {
  HistoryRow row;
  row.id = record.id;
  row.status = std::string(ac::status_label(record.status));
  row.defect_classes = record.defect_classes;
  row.confidence_scores = record.confidence_scores;
  row.finding_count = record.finding_count;
  row.timestamp = ac::format_timestamp(record.created_at);
  row.source_image = record.source_image;
  row.annotated_image = record.annotated_image;
  return row;
}

std::expected<DashboardView, ac::InspectionError> build_dashboard(
    const storage::IInspectionLedger& ledger,
    const ac::OperatorRef& op,
    std::size_t recent_limit) {
  auto counts = ledger.aggregate(op);
  if (!counts) return std::unexpected(counts.error());
  auto class_counts = ledger.defect_class_counts(op);
  if (!class_counts) return std::unexpected(class_counts.error());
  auto recent = ledger.recent(op, recent_limit);
  if (!recent) return std::unexpected(recent.error());

  DashboardView view;
  view.operator_name = op.display_name.empty() ? op.id : op.display_name;
  view.counts = *counts;
  view.class_counts = std::move(*class_counts);
  view.recent.reserve(recent->size());
  for (const auto& r : *recent) {
    view.recent.push_back(to_history_row(r));
  }
  return view;
}

std::expected<std::vector<HistoryRow>, ac::InspectionError> build_history(
    const storage::IInspectionLedger& ledger, const ac::OperatorRef& op) {
  auto records = ledger.all(op);
  if (!records) return std::unexpected(records.error());
  std::vector<HistoryRow> rows;
  rows.reserve(records->size());
  for (const auto& r : *records) {
    rows.push_back(to_history_row(r));
  }
  return rows;
}

void print_history(std::ostream& out, const std::vector<HistoryRow>& rows) {
  if (rows.empty()) {
    out << "  (no inspections)\n";
    return;
  }
  for (const auto& r : rows) {
    out << "  #" << r.id << "  " << r.timestamp << "  " << r.status << "  defects=" << r.finding_count
        << "  classes=" << r.defect_classes << "  confidence=" << r.confidence_scores
        << "  result=" << r.annotated_image << "\n";
  }
}

void print_dashboard(std::ostream& out, const DashboardView& view) {
  out << "Operator: " << view.operator_name << "\n"
      << "Total inspections: " << view.counts.total << "\n"
      << "Broken: " << view.counts.fail_count << "\n"
      << "Non-Broken: " << view.counts.pass_count << "\n";
  if (!view.class_counts.empty()) {
    out << "Defects by class:\n";
    for (const auto& [name, count] : view.class_counts) {
      out << "  " << name << ": " << count << "\n";
    }
  }
  out << "Recent inspections:\n";
  print_history(out, view.recent);
}

void print_summary(std::ostream& out, const ac::InspectionSummary& summary) {
  out << "record=" << summary.record_id << " status=" << ac::status_label(summary.status)
      << " defects=" << summary.finding_count << "\n";
  for (const auto& f : summary.findings) {
    out << "  " << f.class_name << " confidence=" << f.confidence << "\n";
  }
  out << "  original=" << summary.source_image << "\n"
      << "  result=" << summary.annotated_image << "\n";
}

}  // namespace autoinspect::app
