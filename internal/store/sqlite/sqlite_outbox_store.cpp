#include "sqlite_outbox_store.hpp"

#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "sqlite_tx.hpp"

namespace outbox::store::sqlite {

using model::Event;
using model::EventStatus;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* b = sqlite3_column_blob(st, col);
  return b ? std::string(static_cast<const char*>(b), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

static int64_t NowMs() {
  return static_cast<int64_t>(util::ToUnixMillis(util::Now()));
}

static Event ReadRow(sqlite3_stmt* st) {
  Event event;
  event.id             = ColText(st, 0);
  event.payload        = ColBlob(st, 1);
  event.status         = static_cast<EventStatus>(sqlite3_column_int(st, 2));
  event.failure_reason = ColText(st, 3);
  return event;
}

SqliteOutboxStore::SqliteOutboxStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  BootstrapSchema();
}

void SqliteOutboxStore::BootstrapSchema() {
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS outbox_events (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, payload BLOB NOT NULL, "
      "status INTEGER NOT NULL, failure_reason TEXT, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);");
  db_->Exec("CREATE INDEX IF NOT EXISTS outbox_events_status_seq ON outbox_events(status, seq);");

  db_->Exec("SELECT seq,id,payload,status,failure_reason,created_at_ms,updated_at_ms FROM outbox_events LIMIT 1;");
}

Result SqliteOutboxStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Producer side
// ------------------------------------------------------------------

Result SqliteOutboxStore::Append(const Event& event) {
  if (event.id.empty()) {
    return Result::Err(ErrorCode::InvalidArgument, "event id must not be empty");
  }

  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  const char* sql =
      "INSERT INTO outbox_events(id,payload,status,failure_reason,created_at_ms,updated_at_ms) VALUES(?,?,?,NULL,?,?);";

  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr); rc != SQLITE_OK) return Translate(db, rc);
  Statement st(raw);

  const auto now = NowMs();
  BindText(st.get(), 1, event.id);
  BindBlob(st.get(), 2, event.payload);
  sqlite3_bind_int(st.get(), 3, static_cast<int>(EventStatus::kPending));
  BindI64(st.get(), 4, now);
  BindI64(st.get(), 5, now);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "event " + event.id + " already in outbox");
  }
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Relay side
// ------------------------------------------------------------------

std::vector<Event> SqliteOutboxStore::SelectByStatus(EventStatus status) {
  auto* db = db_->Handle();

  const char* sql = "SELECT id,payload,status,failure_reason FROM outbox_events WHERE status=? ORDER BY seq;";

  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr); rc != SQLITE_OK) throw StoreError(Translate(db, rc));
  Statement st(raw);

  sqlite3_bind_int(st.get(), 1, static_cast<int>(status));

  std::vector<Event> events;
  int                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    events.push_back(ReadRow(st.get()));
  }
  if (rc != SQLITE_DONE) throw StoreError(Translate(db, rc));
  return events;
}

PendingScan SqliteOutboxStore::ListPending() {
  std::lock_guard lock(mutex_);

  PendingScan scan;
  try {
    scan.events = SelectByStatus(EventStatus::kPending);
  } catch (const StoreError& e) {
    scan.status = e.result();
  }
  return scan;
}

Result SqliteOutboxStore::UpdateStatus(const std::string& id, EventStatus from, EventStatus to, const std::string& reason) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  try {
    SqliteTransaction tx(db_);

    sqlite3_stmt* raw = nullptr;
    if (int rc = sqlite3_prepare_v2(db, "SELECT status FROM outbox_events WHERE id=?;", -1, &raw, nullptr); rc != SQLITE_OK) {
      return Translate(db, rc);
    }
    Statement select(raw);
    BindText(select.get(), 1, id);

    int rc = sqlite3_step(select.get());
    if (rc == SQLITE_DONE) {
      return Result::Err(ErrorCode::NotFound, "event " + id + " not in outbox");
    }
    if (rc != SQLITE_ROW) return Translate(db, rc);

    const auto current = static_cast<EventStatus>(sqlite3_column_int(select.get(), 0));
    if (current != from) {
      return Result::Err(ErrorCode::InvalidTransition, "event " + id + " is " + std::string(model::ToString(current)));
    }
    select.reset();

    raw = nullptr;
    if (rc = sqlite3_prepare_v2(db, "UPDATE outbox_events SET status=?, failure_reason=?, updated_at_ms=? WHERE id=?;", -1, &raw, nullptr);
        rc != SQLITE_OK) {
      return Translate(db, rc);
    }
    Statement update(raw);
    sqlite3_bind_int(update.get(), 1, static_cast<int>(to));
    if (to == EventStatus::kFailed) {
      BindText(update.get(), 2, reason);
    } else {
      sqlite3_bind_null(update.get(), 2);
    }
    BindI64(update.get(), 3, NowMs());
    BindText(update.get(), 4, id);

    rc = sqlite3_step(update.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    update.reset();

    tx.Commit();
    return Result::Ok();
  } catch (const SqliteError& e) {
    return Translate(db, e.code());
  }
}

Result SqliteOutboxStore::MarkProcessed(const std::string& id) {
  return UpdateStatus(id, EventStatus::kPending, EventStatus::kProcessed, {});
}

Result SqliteOutboxStore::MarkFailed(const std::string& id, const std::string& reason) {
  return UpdateStatus(id, EventStatus::kPending, EventStatus::kFailed, reason);
}

// ------------------------------------------------------------------
// Inspection / maintenance
// ------------------------------------------------------------------

std::optional<Event> SqliteOutboxStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db, "SELECT id,payload,status,failure_reason FROM outbox_events WHERE id=?;", -1, &raw, nullptr);
      rc != SQLITE_OK) {
    throw StoreError(Translate(db, rc));
  }
  Statement st(raw);
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw StoreError(Translate(db, rc));
  return ReadRow(st.get());
}

std::vector<Event> SqliteOutboxStore::ListFailed() {
  std::lock_guard lock(mutex_);
  return SelectByStatus(EventStatus::kFailed);
}

Result SqliteOutboxStore::Requeue(const std::string& id) {
  return UpdateStatus(id, EventStatus::kFailed, EventStatus::kPending, {});
}

Result SqliteOutboxStore::Compact() {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db, "DELETE FROM outbox_events WHERE status=?;", -1, &raw, nullptr); rc != SQLITE_OK) {
    return Translate(db, rc);
  }
  Statement st(raw);
  sqlite3_bind_int(st.get(), 1, static_cast<int>(EventStatus::kProcessed));

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  OUTBOX_LOG_INFO("Compacted sqlite outbox",
                  {observability::StringField("path", db_->Path()), observability::IntField("removed", sqlite3_changes(db))});
  return Result::Ok();
}

StoreStats SqliteOutboxStore::Stats() {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db, "SELECT status, COUNT(*) FROM outbox_events GROUP BY status;", -1, &raw, nullptr); rc != SQLITE_OK) {
    throw StoreError(Translate(db, rc));
  }
  Statement st(raw);

  StoreStats stats;
  int        rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    const auto count = static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 1));
    switch (static_cast<EventStatus>(sqlite3_column_int(st.get(), 0))) {
      case EventStatus::kPending:
        stats.pending = count;
        break;
      case EventStatus::kProcessed:
        stats.processed = count;
        break;
      case EventStatus::kFailed:
        stats.failed = count;
        break;
    }
  }
  if (rc != SQLITE_DONE) throw StoreError(Translate(db, rc));
  return stats;
}

} // namespace outbox::store::sqlite
