#include <autoinspect/storage/inspection_ledger.hpp>
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace autoinspect::storage {

namespace ac = autoinspect::core;

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS inspections (
  id                INTEGER PRIMARY KEY AUTOINCREMENT,
  operator_id       TEXT    NOT NULL,
  source_image      TEXT    NOT NULL,
  annotated_image   TEXT    NOT NULL,
  vehicle_status    TEXT    NOT NULL CHECK (vehicle_status IN ('Non-Broken', 'Broken')),
  defect_classes    TEXT    NOT NULL,
  confidence_scores TEXT    NOT NULL,
  finding_count     INTEGER NOT NULL CHECK (finding_count >= 0),
  created_at        INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_inspections_operator_recent
  ON inspections (operator_id, created_at DESC, id DESC);
CREATE TABLE IF NOT EXISTS inspection_findings (
  inspection_id INTEGER NOT NULL REFERENCES inspections (id),
  position      INTEGER NOT NULL,
  class_name    TEXT    NOT NULL,
  confidence    REAL    NOT NULL,
  x1            INTEGER NOT NULL,
  y1            INTEGER NOT NULL,
  x2            INTEGER NOT NULL,
  y2            INTEGER NOT NULL,
  PRIMARY KEY (inspection_id, position)
);
)sql";

constexpr const char* kRecordColumns =
    "id, operator_id, source_image, annotated_image, vehicle_status, defect_classes, "
    "confidence_scores, finding_count, created_at";

using Millis = std::chrono::milliseconds;

std::int64_t to_millis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<Millis>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_millis(std::int64_t ms) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(Millis(ms)));
}

/// Owns a prepared statement; finalized on destruction.
class Statement {
 public:
  Statement(sqlite3* db, std::string_view sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr) !=
        SQLITE_OK) {
      spdlog::error("sqlite prepare failed: {}", sqlite3_errmsg(db));
      stmt_ = nullptr;
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  [[nodiscard]] bool ok() const noexcept { return stmt_ != nullptr; }
  [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

  bool bind(int index, std::string_view text) {
    return sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()),
                             SQLITE_TRANSIENT) == SQLITE_OK;
  }
  bool bind(int index, std::int64_t value) {
    return sqlite3_bind_int64(stmt_, index, value) == SQLITE_OK;
  }
  bool bind(int index, double value) {
    return sqlite3_bind_double(stmt_, index, value) == SQLITE_OK;
  }

  /// SQLITE_ROW, SQLITE_DONE or an error code (logged).
  int step() {
    const int rc = sqlite3_step(stmt_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      spdlog::error("sqlite step failed: {}", sqlite3_errmsg(db_));
    }
    return rc;
  }

  [[nodiscard]] std::string text(int col) const {
    const auto* p = sqlite3_column_text(stmt_, col);
    return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
  }
  [[nodiscard]] std::int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

 private:
  sqlite3* db_;
  sqlite3_stmt* stmt_{nullptr};
};

bool exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::error("sqlite exec failed: {}", err ? err : sqlite3_errmsg(db));
    sqlite3_free(err);
    return false;
  }
  return true;
}

/// Rolls back unless commit() succeeded.
class Transaction {
 public:
  explicit Transaction(sqlite3* db) : db_(db), open_(exec(db, "BEGIN IMMEDIATE")) {}
  ~Transaction() {
    if (open_) exec(db_, "ROLLBACK");
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  [[nodiscard]] bool begun() const noexcept { return open_; }

  bool commit() {
    if (!open_ || !exec(db_, "COMMIT")) return false;
    open_ = false;
    return true;
  }

 private:
  sqlite3* db_;
  bool open_;
};

std::expected<ac::InspectionRecord, ac::InspectionError> read_record(const Statement& st) {
  ac::InspectionRecord r;
  r.id = st.int64(0);
  r.operator_id = st.text(1);
  r.source_image = st.text(2);
  r.annotated_image = st.text(3);
  const auto status = ac::parse_status_label(st.text(4));
  if (!status) {
    spdlog::error("inspection {} has unknown status '{}'", r.id, st.text(4));
    return std::unexpected(ac::InspectionError::Persistence);
  }
  r.status = *status;
  r.defect_classes = st.text(5);
  r.confidence_scores = st.text(6);
  r.finding_count = static_cast<std::size_t>(st.int64(7));
  r.created_at = from_millis(st.int64(8));
  return r;
}

}  // namespace

struct SqliteInspectionLedger::Impl {
  sqlite3* db{nullptr};
  mutable std::mutex mutex;

  ~Impl() { sqlite3_close(db); }

  std::expected<std::vector<ac::InspectionRecord>, ac::InspectionError> select(
      const std::string& operator_id, std::int64_t limit) const {
    const std::string sql = std::string("SELECT ") + kRecordColumns +
                            " FROM inspections WHERE operator_id = ?1"
                            " ORDER BY created_at DESC, id DESC LIMIT ?2";
    std::lock_guard lock(mutex);
    Statement st(db, sql);
    if (!st.ok() || !st.bind(1, operator_id) || !st.bind(2, limit)) {
      return std::unexpected(ac::InspectionError::Persistence);
    }
    std::vector<ac::InspectionRecord> out;
    int rc;
    while ((rc = st.step()) == SQLITE_ROW) {
      auto r = read_record(st);
      if (!r) return std::unexpected(r.error());
      out.push_back(std::move(*r));
    }
    if (rc != SQLITE_DONE) {
      return std::unexpected(ac::InspectionError::Persistence);
    }
    return out;
  }
};

SqliteInspectionLedger::SqliteInspectionLedger(const std::string& database_path)
    : impl_(std::make_unique<Impl>()) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(database_path.c_str(), &impl_->db, flags, nullptr) != SQLITE_OK) {
    const std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
    throw std::runtime_error("SqliteInspectionLedger: cannot open " + database_path + ": " + msg);
  }
  sqlite3_busy_timeout(impl_->db, 5000);
  if (!exec(impl_->db, "PRAGMA foreign_keys = ON") || !exec(impl_->db, kSchema)) {
    throw std::runtime_error("SqliteInspectionLedger: cannot create schema in " + database_path);
  }

  spdlog::debug("opened inspection ledger {}", database_path);
}

SqliteInspectionLedger::~SqliteInspectionLedger() = default;

std::expected<ac::InspectionRecord, ac::InspectionError> SqliteInspectionLedger::create(
    const ac::OperatorRef& op,
    const ac::ImageRef& source_image,
    const ac::ImageRef& annotated_image,
    ac::VehicleStatus status,
    const ac::FindingSet& findings) {
  if (op.id.empty() || source_image.empty() || annotated_image.empty()) {
    return std::unexpected(ac::InspectionError::InvalidRecord);
  }
  if (status != ac::classify(findings)) {
    spdlog::error("refusing record for {}: status {} with {} findings", op.id,
                  ac::status_label(status), findings.size());
    return std::unexpected(ac::InspectionError::InvalidRecord);
  }

  ac::InspectionRecord record;
  record.operator_id = op.id;
  record.source_image = source_image;
  record.annotated_image = annotated_image;
  record.status = status;
  record.defect_classes = ac::summarize_classes(findings);
  record.confidence_scores = ac::summarize_confidences(findings);
  record.finding_count = findings.size();

  std::lock_guard lock(impl_->mutex);
  sqlite3* db = impl_->db;

  Transaction tx(db);
  if (!tx.begun()) {
    return std::unexpected(ac::InspectionError::Persistence);
  }

  // The write lock is held from here on, so the newest timestamp in the file is final
  // for this append even when other connections share the database.
  std::int64_t newest_ms = 0;
  {
    Statement newest(db, "SELECT COALESCE(MAX(created_at), 0) FROM inspections");
    if (!newest.ok() || newest.step() != SQLITE_ROW) {
      return std::unexpected(ac::InspectionError::Persistence);
    }
    newest_ms = newest.int64(0);
  }
  const std::int64_t created_ms =
      std::max(to_millis(std::chrono::system_clock::now()), newest_ms);

  Statement insert(db,
                   "INSERT INTO inspections (operator_id, source_image, annotated_image, "
                   "vehicle_status, defect_classes, confidence_scores, finding_count, created_at) "
                   "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
  if (!insert.ok() || !insert.bind(1, record.operator_id) ||
      !insert.bind(2, record.source_image) || !insert.bind(3, record.annotated_image) ||
      !insert.bind(4, ac::status_label(status)) || !insert.bind(5, record.defect_classes) ||
      !insert.bind(6, record.confidence_scores) ||
      !insert.bind(7, static_cast<std::int64_t>(record.finding_count)) ||
      !insert.bind(8, created_ms) || insert.step() != SQLITE_DONE) {
    return std::unexpected(ac::InspectionError::Persistence);
  }
  record.id = sqlite3_last_insert_rowid(db);

  Statement finding_insert(db,
                           "INSERT INTO inspection_findings (inspection_id, position, class_name, "
                           "confidence, x1, y1, x2, y2) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
  if (!finding_insert.ok()) {
    return std::unexpected(ac::InspectionError::Persistence);
  }
  for (std::size_t i = 0; i < findings.size(); ++i) {
    const ac::Finding& f = findings[i];
    sqlite3_reset(finding_insert.get());
    if (!finding_insert.bind(1, record.id) ||
        !finding_insert.bind(2, static_cast<std::int64_t>(i)) ||
        !finding_insert.bind(3, f.class_name) ||
        !finding_insert.bind(4, static_cast<double>(f.confidence)) ||
        !finding_insert.bind(5, static_cast<std::int64_t>(f.bbox.x1)) ||
        !finding_insert.bind(6, static_cast<std::int64_t>(f.bbox.y1)) ||
        !finding_insert.bind(7, static_cast<std::int64_t>(f.bbox.x2)) ||
        !finding_insert.bind(8, static_cast<std::int64_t>(f.bbox.y2)) ||
        finding_insert.step() != SQLITE_DONE) {
      return std::unexpected(ac::InspectionError::Persistence);
    }
  }

  if (!tx.commit()) {
    return std::unexpected(ac::InspectionError::Persistence);
  }
  record.created_at = from_millis(created_ms);
  spdlog::info("inspection {} recorded for {}: {} ({} findings)", record.id, op.id,
               ac::status_label(status), record.finding_count);
  return record;
}

std::expected<std::vector<ac::InspectionRecord>, ac::InspectionError>
SqliteInspectionLedger::recent(const ac::OperatorRef& op, std::size_t limit) const {
  if (limit == 0) return std::vector<ac::InspectionRecord>{};
  const auto capped = std::min<std::size_t>(
      limit, static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max()));
  return impl_->select(op.id, static_cast<std::int64_t>(capped));
}

std::expected<std::vector<ac::InspectionRecord>, ac::InspectionError>
SqliteInspectionLedger::all(const ac::OperatorRef& op) const {
  // A negative LIMIT means no limit in SQLite.
  return impl_->select(op.id, -1);
}

std::expected<ac::InspectionCounts, ac::InspectionError> SqliteInspectionLedger::aggregate(
    const ac::OperatorRef& op) const {
  std::lock_guard lock(impl_->mutex);
  Statement st(impl_->db,
               "SELECT COUNT(*), "
               "COALESCE(SUM(vehicle_status = 'Non-Broken'), 0), "
               "COALESCE(SUM(vehicle_status = 'Broken'), 0) "
               "FROM inspections WHERE operator_id = ?1");
  if (!st.ok() || !st.bind(1, op.id) || st.step() != SQLITE_ROW) {
    return std::unexpected(ac::InspectionError::Persistence);
  }
  ac::InspectionCounts c;
  c.total = static_cast<std::size_t>(st.int64(0));
  c.pass_count = static_cast<std::size_t>(st.int64(1));
  c.fail_count = static_cast<std::size_t>(st.int64(2));
  return c;
}

std::expected<ClassCounts, ac::InspectionError> SqliteInspectionLedger::defect_class_counts(
    const ac::OperatorRef& op) const {
  std::lock_guard lock(impl_->mutex);
  Statement st(impl_->db,
               "SELECT f.class_name, COUNT(*) FROM inspection_findings f "
               "JOIN inspections i ON i.id = f.inspection_id "
               "WHERE i.operator_id = ?1 GROUP BY f.class_name");
  if (!st.ok() || !st.bind(1, op.id)) {
    return std::unexpected(ac::InspectionError::Persistence);
  }
  ClassCounts out;
  int rc;
  while ((rc = st.step()) == SQLITE_ROW) {
    out[st.text(0)] = static_cast<std::size_t>(st.int64(1));
  }
  if (rc != SQLITE_DONE) {
    return std::unexpected(ac::InspectionError::Persistence);
  }
  return out;
}

}  // namespace autoinspect::storage
