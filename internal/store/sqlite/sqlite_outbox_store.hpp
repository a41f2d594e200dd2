#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "internal/store/outbox_store.hpp"
#include "sqlite_db.hpp"

namespace outbox::store::sqlite {

/*
  SQLite-backed outbox.

  Table outbox_events keeps append order in seq; id is UNIQUE so duplicate
  appends surface as constraint violations (→ AlreadyExists). Status
  changes are single conditional UPDATEs inside BEGIN IMMEDIATE, so the
  row is never observed half-updated.

  One connection is shared; mutex_ keeps transactions on it from
  interleaving across relay threads.
*/
class SqliteOutboxStore final : public OutboxStore {
 public:
  // creates the schema if needed; throws SqliteError on failure
  explicit SqliteOutboxStore(std::shared_ptr<SqliteDB> db);

  Result      Append(const model::Event& event) override;
  PendingScan ListPending() override;
  Result      MarkProcessed(const std::string& id) override;
  Result      MarkFailed(const std::string& id, const std::string& reason) override;

  std::optional<model::Event> Get(const std::string& id) override;
  std::vector<model::Event>   ListFailed() override;
  Result                      Requeue(const std::string& id) override;
  Result                      Compact() override;
  StoreStats                  Stats() override;

 private:
  static Result Translate(sqlite3* db, int rc);

  void   BootstrapSchema();
  Result UpdateStatus(const std::string& id, model::EventStatus from, model::EventStatus to, const std::string& reason);
  std::vector<model::Event> SelectByStatus(model::EventStatus status);

  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace outbox::store::sqlite
