#pragma once

#include <autoinspect/core/error.hpp>
#include <autoinspect/core/finding.hpp>
#include <autoinspect/core/inspection_record.hpp>
#include <autoinspect/core/status.hpp>
#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace autoinspect::storage {

/// Defect class -> number of findings of that class.
using ClassCounts = std::map<std::string, std::size_t>;

/// Append-only store of inspection records. Every query is scoped to one operator and
/// never returns another operator's records. Implementations must be safe to call from
/// several threads.
class IInspectionLedger {
 public:
  virtual ~IInspectionLedger() = default;

  /// Assigns id and timestamp and writes the record atomically. InvalidRecord if the
  /// status contradicts the findings or a required field is empty; Persistence if the
  /// write fails, in which case nothing of the record is visible to readers.
  [[nodiscard]] virtual std::expected<autoinspect::core::InspectionRecord,
                                      autoinspect::core::InspectionError>
  create(const autoinspect::core::OperatorRef& op,
         const autoinspect::core::ImageRef& source_image,
         const autoinspect::core::ImageRef& annotated_image,
         autoinspect::core::VehicleStatus status,
         const autoinspect::core::FindingSet& findings) = 0;

  /// At most limit records, newest first; ties broken by descending id.
  [[nodiscard]] virtual std::expected<std::vector<autoinspect::core::InspectionRecord>,
                                      autoinspect::core::InspectionError>
  recent(const autoinspect::core::OperatorRef& op, std::size_t limit) const = 0;

  /// Every record, same order as recent().
  [[nodiscard]] virtual std::expected<std::vector<autoinspect::core::InspectionRecord>,
                                      autoinspect::core::InspectionError>
  all(const autoinspect::core::OperatorRef& op) const = 0;

  /// Counts computed from the stored rows on every call.
  [[nodiscard]] virtual std::expected<autoinspect::core::InspectionCounts,
                                      autoinspect::core::InspectionError>
  aggregate(const autoinspect::core::OperatorRef& op) const = 0;

  /// Findings per defect class across the operator's records.
  [[nodiscard]] virtual std::expected<ClassCounts, autoinspect::core::InspectionError>
  defect_class_counts(const autoinspect::core::OperatorRef& op) const = 0;
};

/// SQLite-backed ledger. One connection, calls serialized by a mutex; id assignment and
/// the append (record row plus one row per finding) happen in one IMMEDIATE transaction.
class SqliteInspectionLedger : public IInspectionLedger {
 public:
  /// Opens or creates the database and its schema. ":memory:" gives a private in-memory
  /// ledger. Throws std::runtime_error if the database cannot be opened or migrated.
  explicit SqliteInspectionLedger(const std::string& database_path);

  ~SqliteInspectionLedger() override;

  SqliteInspectionLedger(const SqliteInspectionLedger&) = delete;
  SqliteInspectionLedger& operator=(const SqliteInspectionLedger&) = delete;

  [[nodiscard]] std::expected<autoinspect::core::InspectionRecord,
                              autoinspect::core::InspectionError>
  create(const autoinspect::core::OperatorRef& op,
         const autoinspect::core::ImageRef& source_image,
         const autoinspect::core::ImageRef& annotated_image,
         autoinspect::core::VehicleStatus status,
         const autoinspect::core::FindingSet& findings) override;

  [[nodiscard]] std::expected<std::vector<autoinspect::core::InspectionRecord>,
                              autoinspect::core::InspectionError>
  recent(const autoinspect::core::OperatorRef& op, std::size_t limit) const override;

  [[nodiscard]] std::expected<std::vector<autoinspect::core::InspectionRecord>,
                              autoinspect::core::InspectionError>
  all(const autoinspect::core::OperatorRef& op) const override;

  [[nodiscard]] std::expected<autoinspect::core::InspectionCounts,
                              autoinspect::core::InspectionError>
  aggregate(const autoinspect::core::OperatorRef& op) const override;

  [[nodiscard]] std::expected<ClassCounts, autoinspect::core::InspectionError>
  defect_class_counts(const autoinspect::core::OperatorRef& op) const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace autoinspect::storage
